/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "AlertDispatcher.hpp"

#include <utility>
#include <spdlog/spdlog.h>

#include "Time.hpp"

LAlertDispatcher::LAlertDispatcher(std::shared_ptr<INotificationSink> Sink_, std::string Title_)
	: Sink(std::move(Sink_))
	, Title(std::move(Title_))
{
}

void LAlertDispatcher::Attach(sigslot::signal<LAlertEvent const&>& Signal)
{
	Connection = sigslot::scoped_connection(Signal.connect(&LAlertDispatcher::Dispatch, this));
}

void LAlertDispatcher::Dispatch(LAlertEvent const& Event)
{
	spdlog::warn("{}", FormatLogLine(Event));
	++DispatchedCount;

	if (!Sink || !Sink->Notify(Title, FormatMessage(Event)))
	{
		++FailedCount;
		spdlog::warn("failed to send notification for {}", Event.Remote.ToString());
	}
}

std::string LAlertDispatcher::FormatLogLine(LAlertEvent const& Event)
{
	return fmt::format("[{}] ALERT: connection to {} range={} process={} pid={} local_port={}",
		LTime::FormatTimestamp(Event.Timestamp),
		Event.Remote.ToString(),
		Event.MatchedRange,
		Event.ProcessName,
		Event.PID ? std::to_string(*Event.PID) : std::string("-"),
		Event.LocalPort);
}

std::string LAlertDispatcher::FormatMessage(LAlertEvent const& Event)
{
	return fmt::format("Connection detected to monitored range!\nTarget: {}\nProcess: {}\nRange: {}",
		Event.Remote.ToString(),
		Event.ProcessName,
		Event.MatchedRange);
}
