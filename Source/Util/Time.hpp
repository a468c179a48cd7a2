/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "Types.hpp"

namespace LTime
{
	// Local wall-clock time as YYYY-mm-dd HH:MM:SS
	std::string FormatTimestamp(LTimestamp Time);

	inline LTimestamp Now()
	{
		return LWallClock::now();
	}
} // namespace LTime
