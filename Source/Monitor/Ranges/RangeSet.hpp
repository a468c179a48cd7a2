/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "AddressRange.hpp"

// Ranges in configuration order. Membership is the union of all ranges, order only
// decides which range gets reported by FindFirst().
class LRangeSet
{
	std::vector<LAddressRange> Ranges{};

public:
	LRangeSet() = default;

	explicit LRangeSet(std::vector<LAddressRange> Ranges_)
		: Ranges(std::move(Ranges_))
	{
	}

	// Parses a comma separated list. Malformed entries are logged and skipped,
	// SetName is only used for the log message.
	static LRangeSet Parse(std::string_view List, std::string_view SetName);

	[[nodiscard]] bool                         Contains(LIPAddress const& Address) const;
	[[nodiscard]] std::optional<LAddressRange> FindFirst(LIPAddress const& Address) const;

	[[nodiscard]] bool   IsEmpty() const { return Ranges.empty(); }
	[[nodiscard]] size_t Size() const { return Ranges.size(); }

	[[nodiscard]] std::vector<LAddressRange> const& GetRanges() const { return Ranges; }

	[[nodiscard]] std::string ToString() const;
};
