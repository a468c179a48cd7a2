/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "MonitorConfig.hpp"

#include <charconv>
#include <cstdlib>
#include <INIReader.h>
#include <spdlog/spdlog.h>

#include "StringUtil.hpp"

std::optional<LMonitorConfig> LMonitorConfig::Load(std::optional<stdfs::path> const& ExplicitPath)
{
	LMonitorConfig Config{};

	if (ExplicitPath)
	{
		if (!Config.LoadFile(*ExplicitPath))
		{
			return std::nullopt;
		}
	}
	else
	{
		bool bLoaded = false;
		for (auto const& Path : GetSearchPaths())
		{
			if (LFilesystem::Exists(Path))
			{
				bLoaded = Config.LoadFile(Path);
				break;
			}
		}

		if (!bLoaded)
		{
			spdlog::info("no configuration file loaded, using defaults");
		}
	}

	Config.ApplyEnvironment();
	return Config;
}

std::vector<stdfs::path> LMonitorConfig::GetSearchPaths()
{
	std::vector<stdfs::path> Paths{ "./lauscher.ini" };

	char const* Xdg = std::getenv("XDG_CONFIG_HOME");
	if (Xdg && Xdg[0] != '\0')
	{
		Paths.push_back(stdfs::path(Xdg) / "lauscher" / "lauscher.ini");
	}
	else if (char const* Home = std::getenv("HOME"); Home && Home[0] != '\0')
	{
		Paths.push_back(stdfs::path(Home) / ".config" / "lauscher" / "lauscher.ini");
	}

	Paths.emplace_back("/etc/lauscher/lauscher.ini");
	return Paths;
}

bool LMonitorConfig::LoadFile(stdfs::path const& Path)
{
	INIReader Reader(Path.string());

	if (Reader.ParseError() != 0)
	{
		if (Reader.ParseError() < 0)
		{
			spdlog::error("can't load '{}'", Path.string());
		}
		else
		{
			spdlog::error("can't load '{}': syntax error on line {}", Path.string(), Reader.ParseError());
		}
		return false;
	}

	auto SafeGet = [&](std::string const& Section, std::string const& Name, std::string& OutVal) {
		if (Reader.HasValue(Section, Name))
		{
			OutVal = Reader.Get(Section, Name, OutVal);
		}
	};

	SafeGet("ranges", "target", TargetIpRanges);
	SafeGet("ranges", "exclude", ExcludeIpRanges);

	if (Reader.HasValue("monitor", "interval"))
	{
		SetInterval(Reader.Get("monitor", "interval", ""));
	}

	bNotificationsEnabled = Reader.GetBoolean("notify", "enabled", bNotificationsEnabled);
	SafeGet("notify", "title", NotificationTitle);
	SafeGet("notify", "urgency", NotificationUrgency);
	SafeGet("notify", "icon", NotificationIcon);

	if (Reader.HasValue("log", "level"))
	{
		SetLogLevel(Reader.Get("log", "level", LogLevel));
	}

	ConfigFilePath = Path;
	spdlog::info("loaded configuration from {}", Path.string());
	return true;
}

void LMonitorConfig::ApplyEnvironment()
{
	if (char const* Targets = std::getenv("TARGET_IP_RANGES"))
	{
		TargetIpRanges = Targets;
	}

	if (char const* Excludes = std::getenv("EXCLUDE_IP_RANGES"))
	{
		ExcludeIpRanges = Excludes;
	}

	if (char const* IntervalText = std::getenv("MONITOR_INTERVAL"))
	{
		SetInterval(IntervalText);
	}

	if (char const* Level = std::getenv("LAUSCHER_LOG_LEVEL"))
	{
		SetLogLevel(Level);
	}
}

bool LMonitorConfig::SetInterval(std::string_view Text)
{
	std::string_view const Trimmed = LStringUtil::Trim(Text);

	long long Seconds = 0;
	auto      Result = std::from_chars(Trimmed.data(), Trimmed.data() + Trimmed.size(), Seconds);
	if (Trimmed.empty() || Result.ec != std::errc() || Result.ptr != Trimmed.data() + Trimmed.size() || Seconds <= 0)
	{
		spdlog::warn("invalid monitor interval '{}', keeping {}s", Text, Interval.count());
		return false;
	}

	if (Seconds > MaxInterval.count())
	{
		spdlog::warn("monitor interval '{}' exceeds {}s, keeping {}s", Text, MaxInterval.count(), Interval.count());
		return false;
	}

	Interval = LSeconds(Seconds);
	return true;
}

bool LMonitorConfig::SetLogLevel(std::string const& Level)
{
	auto const Parsed = spdlog::level::from_str(Level);
	if (Parsed == spdlog::level::off && Level != "off")
	{
		spdlog::warn("unknown log level '{}', keeping '{}'", Level, LogLevel);
		return false;
	}

	LogLevel = Level;
	return true;
}

void LMonitorConfig::LogConfig() const
{
	if (!ConfigFilePath.empty())
	{
		spdlog::info("config file={}", ConfigFilePath.string());
	}
	spdlog::info("target ranges={}", TargetIpRanges);
	spdlog::info("exclude ranges={}", ExcludeIpRanges.empty() ? "<none>" : ExcludeIpRanges);
	spdlog::info("interval={}s", Interval.count());
	spdlog::info("notifications={} urgency={}", bNotificationsEnabled ? "on" : "off", NotificationUrgency);
	spdlog::info("log level={}", LogLevel);
}
