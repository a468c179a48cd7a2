/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>

#include "Monitor.hpp"
#include "MonitorConfig.hpp"
#include "Ranges/RangeMatcher.hpp"

namespace EExitCode
{
	enum Type : int
	{
		Ok = 0,
		ConfigError = 1,
		MonitorFailure = 2
	};
} // namespace EExitCode

namespace LStartup
{
	// Parses the configured range lists and logs what will be monitored.
	// Returns ConfigError and leaves OutMatcher empty if no valid target range remains.
	EExitCode::Type PrepareMatcher(LMonitorConfig const& Config, std::optional<LRangeMatcher>& OutMatcher);

	EExitCode::Type ToExitCode(EMonitorExit::Type Result);
} // namespace LStartup
