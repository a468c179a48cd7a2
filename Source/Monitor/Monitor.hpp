/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <sigslot/signal.hpp>

#include "Cancellation.hpp"
#include "Alert/AlertStateTracker.hpp"
#include "Net/IConnectionSampler.hpp"
#include "Process/IProcessInfo.hpp"
#include "Ranges/RangeMatcher.hpp"

namespace EMonitorExit
{
	enum Type : uint8_t
	{
		Stopped = 0, // cancellation was requested
		Failure      // a cycle failed unexpectedly
	};
} // namespace EMonitorExit

// Drives the sample -> classify -> alert -> reconcile cycle on a single thread.
class LMonitor
{
	LRangeMatcher                       Matcher;
	std::shared_ptr<IConnectionSampler> Sampler;
	std::shared_ptr<IProcessInfo>       ProcessInfo;
	std::chrono::milliseconds           Interval;

	LAlertStateTracker Tracker{};

	uint64_t CycleCount{};
	uint64_t AlertCount{};
	uint64_t FailedSampleCount{};

public:
	// Fired once per endpoint and presence episode
	sigslot::signal<LAlertEvent const&> OnAlert;

	LMonitor(LRangeMatcher Matcher_, std::shared_ptr<IConnectionSampler> Sampler_,
		std::shared_ptr<IProcessInfo> ProcessInfo_, std::chrono::milliseconds Interval_);

	// One full cycle, returns the number of alerts fired.
	// LSamplingError propagates and leaves the alert state untouched.
	size_t RunCycle();

	// Runs cycles until Stop is requested or a cycle fails with anything but LSamplingError
	EMonitorExit::Type Run(LCancellation const& Stop);

	[[nodiscard]] LAlertStateTracker const& GetTracker() const { return Tracker; }
	[[nodiscard]] LRangeMatcher const&      GetMatcher() const { return Matcher; }

	[[nodiscard]] uint64_t GetCycleCount() const { return CycleCount; }
	[[nodiscard]] uint64_t GetAlertCount() const { return AlertCount; }
	[[nodiscard]] uint64_t GetFailedSampleCount() const { return FailedSampleCount; }
};
