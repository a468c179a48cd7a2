/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Startup.hpp"

#include <utility>
#include <spdlog/spdlog.h>

EExitCode::Type LStartup::PrepareMatcher(LMonitorConfig const& Config, std::optional<LRangeMatcher>& OutMatcher)
{
	OutMatcher.reset();

	LRangeSet Targets = LRangeSet::Parse(Config.TargetIpRanges, "target");
	if (Targets.IsEmpty())
	{
		spdlog::critical("no valid target IP ranges configured, refusing to monitor nothing");
		return EExitCode::ConfigError;
	}
	LRangeSet Excludes = LRangeSet::Parse(Config.ExcludeIpRanges, "exclude");

	spdlog::info("Monitoring connections to: {}", Targets.ToString());
	if (Excludes.IsEmpty())
	{
		spdlog::info("No IP ranges excluded from monitoring");
	}
	else
	{
		spdlog::info("Excluding connections to: {}", Excludes.ToString());
	}

	OutMatcher.emplace(std::move(Targets), std::move(Excludes));
	return EExitCode::Ok;
}

EExitCode::Type LStartup::ToExitCode(EMonitorExit::Type Result)
{
	return Result == EMonitorExit::Stopped ? EExitCode::Ok : EExitCode::MonitorFailure;
}
