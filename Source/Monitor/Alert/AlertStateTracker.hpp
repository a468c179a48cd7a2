/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <unordered_set>

#include "AlertEvent.hpp"
#include "Net/ConnectionSample.hpp"
#include "Ranges/RangeMatcher.hpp"

// Remembers which endpoints were already alerted on.
//
// An endpoint is alerted at most once per presence episode: the first time a
// targeted connection to it shows up it fires and goes into AlertMemory, then
// stays quiet for as long as it keeps appearing in the samples. Reconcile()
// drops every endpoint that wasn't observed in the latest cycle so it fires
// again the next time it appears.
class LAlertStateTracker
{
	std::unordered_set<LEndpointKey> AlertMemory{};

public:
	// Returns an event if Sample is targeted and its endpoint isn't alerted yet.
	// The endpoint is remembered right away, ProcessName is left for the caller.
	std::optional<LAlertEvent> Observe(
		LConnectionSample const& Sample, LClassification const& Classification, LTimestamp Now);

	// AlertMemory = AlertMemory ∩ Observed
	void Reconcile(std::unordered_set<LEndpointKey> const& Observed);

	[[nodiscard]] bool IsAlerted(LEndpointKey const& Key) const { return AlertMemory.contains(Key); }

	[[nodiscard]] std::unordered_set<LEndpointKey> const& GetAlertMemory() const { return AlertMemory; }

	[[nodiscard]] size_t Size() const { return AlertMemory.size(); }
};
