/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Time.hpp"

#include <ctime>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/chrono.h>

std::string LTime::FormatTimestamp(LTimestamp Time)
{
	std::time_t const Seconds = LWallClock::to_time_t(Time);
	std::tm           Local{};
	if (localtime_r(&Seconds, &Local) == nullptr)
	{
		return fmt::format("@{}", static_cast<long long>(Seconds));
	}
	return fmt::format("{:%Y-%m-%d %H:%M:%S}", Local);
}
