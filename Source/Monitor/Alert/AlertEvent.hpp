/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>

#include "IPAddress.hpp"
#include "Types.hpp"

struct LAlertEvent
{
	LEndpoint                 Remote{};
	LPort                     LocalPort{};
	std::string               MatchedRange{};
	std::optional<LProcessId> PID{};
	std::string               ProcessName{};
	LTimestamp                Timestamp{};
};
