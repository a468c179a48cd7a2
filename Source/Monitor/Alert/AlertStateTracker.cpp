/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "AlertStateTracker.hpp"

#include <spdlog/spdlog.h>

std::optional<LAlertEvent> LAlertStateTracker::Observe(
	LConnectionSample const& Sample, LClassification const& Classification, LTimestamp Now)
{
	if (!Classification.IsTargeted())
	{
		return std::nullopt;
	}

	LEndpointKey const Key = MakeEndpointKey(Sample);
	if (!AlertMemory.insert(Key).second)
	{
		return std::nullopt;
	}

	LAlertEvent Event{};
	Event.Remote = Key;
	Event.LocalPort = Sample.Local.Port;
	Event.MatchedRange = Classification.Range ? Classification.Range->ToString() : std::string{};
	Event.PID = Sample.PID;
	Event.Timestamp = Now;
	return Event;
}

void LAlertStateTracker::Reconcile(std::unordered_set<LEndpointKey> const& Observed)
{
	size_t const Removed = std::erase_if(AlertMemory, [&](LEndpointKey const& Key) { return !Observed.contains(Key); });
	if (Removed > 0)
	{
		spdlog::debug("{} endpoint(s) gone, they will alert again when they reappear", Removed);
	}
}
