/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RangeSet.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "StringUtil.hpp"

LRangeSet LRangeSet::Parse(std::string_view List, std::string_view SetName)
{
	std::vector<LAddressRange> Parsed{};

	for (auto const& Entry : LStringUtil::Split(List, ','))
	{
		if (Entry.empty())
		{
			continue;
		}

		if (auto Range = LAddressRange::Parse(Entry))
		{
			Parsed.push_back(*Range);
		}
		else
		{
			spdlog::warn("invalid {} IP range '{}', skipping it", SetName, Entry);
		}
	}

	return LRangeSet(std::move(Parsed));
}

bool LRangeSet::Contains(LIPAddress const& Address) const
{
	return std::ranges::any_of(Ranges, [&](LAddressRange const& Range) { return Range.Contains(Address); });
}

std::optional<LAddressRange> LRangeSet::FindFirst(LIPAddress const& Address) const
{
	auto It = std::ranges::find_if(Ranges, [&](LAddressRange const& Range) { return Range.Contains(Address); });
	if (It == Ranges.end())
	{
		return std::nullopt;
	}
	return *It;
}

std::string LRangeSet::ToString() const
{
	std::string Result;
	for (auto const& Range : Ranges)
	{
		if (!Result.empty())
		{
			Result += ", ";
		}
		Result += Range.ToString();
	}
	return Result;
}
