/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <sigslot/signal.hpp>

#include "AlertEvent.hpp"
#include "INotificationSink.hpp"

// Turns alert events into a log line and a desktop notification.
// A failed notification is logged and counted, nothing else happens: the
// endpoint is already marked as alerted and won't be retried.
class LAlertDispatcher
{
	std::shared_ptr<INotificationSink> Sink;
	std::string                        Title;

	uint64_t DispatchedCount{};
	uint64_t FailedCount{};

	sigslot::scoped_connection Connection{};

public:
	LAlertDispatcher(std::shared_ptr<INotificationSink> Sink_, std::string Title_);

	// Dispatch every event emitted on Signal until this object is destroyed
	void Attach(sigslot::signal<LAlertEvent const&>& Signal);

	void Dispatch(LAlertEvent const& Event);

	[[nodiscard]] static std::string FormatLogLine(LAlertEvent const& Event);
	[[nodiscard]] static std::string FormatMessage(LAlertEvent const& Event);

	[[nodiscard]] uint64_t GetDispatchedCount() const { return DispatchedCount; }
	[[nodiscard]] uint64_t GetFailedCount() const { return FailedCount; }
};
