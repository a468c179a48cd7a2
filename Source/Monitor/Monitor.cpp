/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Monitor.hpp"

#include <exception>
#include <unordered_set>
#include <utility>
#include <spdlog/spdlog.h>

#include "Time.hpp"

LMonitor::LMonitor(LRangeMatcher Matcher_, std::shared_ptr<IConnectionSampler> Sampler_,
	std::shared_ptr<IProcessInfo> ProcessInfo_, std::chrono::milliseconds Interval_)
	: Matcher(std::move(Matcher_))
	, Sampler(std::move(Sampler_))
	, ProcessInfo(std::move(ProcessInfo_))
	, Interval(Interval_)
{
}

size_t LMonitor::RunCycle()
{
	auto const Samples = Sampler->Sample();
	++CycleCount;

	std::unordered_set<LEndpointKey> Observed{};
	size_t                           Fired = 0;

	for (auto const& Sample : Samples)
	{
		if (!Sample.IsEstablished() || Sample.Remote.Address.IsUnspecified() || Sample.Remote.Port == 0)
		{
			continue;
		}

		Observed.insert(MakeEndpointKey(Sample));

		LClassification const Classification = Matcher.Classify(Sample.Remote.Address);
		if (Classification.Result == EMatchResult::Excluded)
		{
			spdlog::trace("{} is excluded by {}", Sample.Remote.ToString(), Classification.Range->ToString());
			continue;
		}

		auto Event = Tracker.Observe(Sample, Classification, LTime::Now());
		if (!Event)
		{
			continue;
		}

		Event->ProcessName = Event->PID ? ProcessInfo->NameOf(*Event->PID) : IProcessInfo::UnknownName;
		++Fired;
		++AlertCount;
		OnAlert(*Event);
	}

	Tracker.Reconcile(Observed);
	return Fired;
}

EMonitorExit::Type LMonitor::Run(LCancellation const& Stop)
{
	while (!Stop.IsStopRequested())
	{
		try
		{
			RunCycle();
		}
		catch (LSamplingError const& Error)
		{
			++FailedSampleCount;
			spdlog::error("failed to sample connections, skipping this cycle: {}", Error.what());
		}
		catch (std::exception const& Error)
		{
			spdlog::critical("monitor cycle failed, stopping: {}", Error.what());
			return EMonitorExit::Failure;
		}

		if (!Stop.WaitFor(Interval))
		{
			break;
		}
	}
	return EMonitorExit::Stopped;
}
