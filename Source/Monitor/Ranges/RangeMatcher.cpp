/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RangeMatcher.hpp"

#include <stdexcept>
#include <utility>

LRangeMatcher::LRangeMatcher(LRangeSet Targets, LRangeSet Excludes)
	: TargetRanges(std::move(Targets))
	, ExcludeRanges(std::move(Excludes))
{
	if (TargetRanges.IsEmpty())
	{
		throw std::invalid_argument("target range set must not be empty");
	}
}

LClassification LRangeMatcher::Classify(LIPAddress const& Address) const
{
	// tcp6 sockets report IPv4 peers as ::ffff:a.b.c.d, both forms are matched
	LIPAddress const Normalized = Address.Normalized();

	auto FindIn = [&](LRangeSet const& Ranges) {
		auto Range = Ranges.FindFirst(Normalized);
		if (!Range && Normalized != Address)
		{
			Range = Ranges.FindFirst(Address);
		}
		return Range;
	};

	if (auto Excluded = FindIn(ExcludeRanges))
	{
		return { EMatchResult::Excluded, Excluded };
	}

	if (auto Targeted = FindIn(TargetRanges))
	{
		return { EMatchResult::Targeted, Targeted };
	}

	return {};
}
