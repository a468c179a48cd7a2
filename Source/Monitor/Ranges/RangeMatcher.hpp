/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>

#include "RangeSet.hpp"

namespace EMatchResult
{
	enum Type : uint8_t
	{
		Ignored = 0,
		Targeted,
		Excluded
	};
} // namespace EMatchResult

struct LClassification
{
	EMatchResult::Type Result{ EMatchResult::Ignored };

	// First matching target range for Targeted, first matching exclude range for Excluded
	std::optional<LAddressRange> Range{};

	[[nodiscard]] bool IsTargeted() const { return Result == EMatchResult::Targeted; }
};

// Exclusion always wins over targeting
class LRangeMatcher
{
	LRangeSet TargetRanges;
	LRangeSet ExcludeRanges;

public:
	// Throws std::invalid_argument if Targets is empty
	LRangeMatcher(LRangeSet Targets, LRangeSet Excludes);

	[[nodiscard]] LClassification Classify(LIPAddress const& Address) const;

	[[nodiscard]] LRangeSet const& GetTargetRanges() const { return TargetRanges; }
	[[nodiscard]] LRangeSet const& GetExcludeRanges() const { return ExcludeRanges; }
};
