/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Filesystem.hpp"
#include "Types.hpp"

struct LMonitorConfig
{
	static constexpr LSeconds MaxInterval{ 24 * 60 * 60 };

	std::string TargetIpRanges{ "10.0.0.0/8,172.16.0.0/12,192.168.0.0/16" };
	std::string ExcludeIpRanges{ "192.168.1.1/32" };
	LSeconds    Interval{ 2 };
	bool        bNotificationsEnabled{ true };
	std::string NotificationTitle{ "Lauscher Alert" };
	std::string NotificationUrgency{ "critical" };
	std::string NotificationIcon{ "dialog-warning" };
	std::string LogLevel{ "info" };
	stdfs::path ConfigFilePath{}; // empty if no file was loaded

	// Defaults, then ExplicitPath or the first config file found, then the environment.
	// Returns nullopt if ExplicitPath was given but can't be loaded.
	static std::optional<LMonitorConfig> Load(std::optional<stdfs::path> const& ExplicitPath);

	static std::vector<stdfs::path> GetSearchPaths();

	bool LoadFile(stdfs::path const& Path);

	// TARGET_IP_RANGES, EXCLUDE_IP_RANGES, MONITOR_INTERVAL, LAUSCHER_LOG_LEVEL
	void ApplyEnvironment();

	// Only whole seconds in [1, MaxInterval] are accepted, the current value is kept otherwise
	bool SetInterval(std::string_view Text);

	bool SetLogLevel(std::string const& Level);

	void LogConfig() const;
};
