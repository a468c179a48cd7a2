/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <cstdlib>
#include <fstream>
#include <unistd.h>
#include <gtest/gtest.h>

#include "MonitorConfig.hpp"

namespace
{
	class MonitorConfigTest : public ::testing::Test
	{
	protected:
		stdfs::path IniPath{};

		void SetUp() override
		{
			ClearEnvironment();
			IniPath = stdfs::temp_directory_path() / ("lauscher-config-" + std::to_string(getpid()) + ".ini");
		}

		void TearDown() override
		{
			ClearEnvironment();
			std::error_code Ec;
			stdfs::remove(IniPath, Ec);
		}

		void WriteIni(std::string const& Content) const
		{
			std::ofstream File(IniPath);
			File << Content;
		}

		static void ClearEnvironment()
		{
			for (char const* Name : { "TARGET_IP_RANGES", "EXCLUDE_IP_RANGES", "MONITOR_INTERVAL", "LAUSCHER_LOG_LEVEL" })
			{
				unsetenv(Name);
			}
		}
	};
} // namespace

TEST_F(MonitorConfigTest, DefaultsCoverPrivateRanges)
{
	LMonitorConfig Config{};
	EXPECT_EQ(Config.TargetIpRanges, "10.0.0.0/8,172.16.0.0/12,192.168.0.0/16");
	EXPECT_EQ(Config.ExcludeIpRanges, "192.168.1.1/32");
	EXPECT_EQ(Config.Interval, LSeconds(2));
	EXPECT_TRUE(Config.bNotificationsEnabled);
	EXPECT_EQ(Config.LogLevel, "info");
}

TEST_F(MonitorConfigTest, EnvironmentOverridesDefaults)
{
	setenv("TARGET_IP_RANGES", "10.1.0.0/16", 1);
	setenv("EXCLUDE_IP_RANGES", "", 1);
	setenv("MONITOR_INTERVAL", "7", 1);

	LMonitorConfig Config{};
	Config.ApplyEnvironment();
	EXPECT_EQ(Config.TargetIpRanges, "10.1.0.0/16");
	EXPECT_EQ(Config.ExcludeIpRanges, "");
	EXPECT_EQ(Config.Interval, LSeconds(7));
}

TEST_F(MonitorConfigTest, InvalidIntervalKeepsPreviousValue)
{
	LMonitorConfig Config{};
	for (char const* Text : { "0", "-3", "abc", "2.5", "", "5s" })
	{
		EXPECT_FALSE(Config.SetInterval(Text)) << Text;
		EXPECT_EQ(Config.Interval, LSeconds(2));
	}

	EXPECT_TRUE(Config.SetInterval(" 10 "));
	EXPECT_EQ(Config.Interval, LSeconds(10));
}

TEST_F(MonitorConfigTest, OversizedIntervalIsRejected)
{
	LMonitorConfig Config{};
	EXPECT_FALSE(Config.SetInterval("10000000000"));
	EXPECT_FALSE(Config.SetInterval("99999999999999999999"));
	EXPECT_FALSE(Config.SetInterval(std::to_string(LMonitorConfig::MaxInterval.count() + 1)));
	EXPECT_EQ(Config.Interval, LSeconds(2));

	EXPECT_TRUE(Config.SetInterval(std::to_string(LMonitorConfig::MaxInterval.count())));
	EXPECT_EQ(Config.Interval, LMonitorConfig::MaxInterval);

	setenv("MONITOR_INTERVAL", "10000000000", 1);
	LMonitorConfig FromEnv{};
	FromEnv.ApplyEnvironment();
	EXPECT_EQ(FromEnv.Interval, LSeconds(2));
}

TEST_F(MonitorConfigTest, UnknownLogLevelIsRejected)
{
	LMonitorConfig Config{};
	EXPECT_FALSE(Config.SetLogLevel("chatty"));
	EXPECT_EQ(Config.LogLevel, "info");
	EXPECT_TRUE(Config.SetLogLevel("debug"));
	EXPECT_TRUE(Config.SetLogLevel("off"));
	EXPECT_EQ(Config.LogLevel, "off");
}

TEST_F(MonitorConfigTest, LoadsIniFile)
{
	WriteIni("[ranges]\n"
			 "target = 172.16.0.0/12\n"
			 "exclude = 172.16.0.1/32\n"
			 "[monitor]\n"
			 "interval = 5\n"
			 "[notify]\n"
			 "enabled = false\n"
			 "title = Heads up\n"
			 "[log]\n"
			 "level = debug\n");

	auto Config = LMonitorConfig::Load(IniPath);
	ASSERT_TRUE(Config);
	EXPECT_EQ(Config->TargetIpRanges, "172.16.0.0/12");
	EXPECT_EQ(Config->ExcludeIpRanges, "172.16.0.1/32");
	EXPECT_EQ(Config->Interval, LSeconds(5));
	EXPECT_FALSE(Config->bNotificationsEnabled);
	EXPECT_EQ(Config->NotificationTitle, "Heads up");
	EXPECT_EQ(Config->NotificationUrgency, "critical");
	EXPECT_EQ(Config->LogLevel, "debug");
	EXPECT_EQ(Config->ConfigFilePath, IniPath);
}

TEST_F(MonitorConfigTest, EnvironmentOverridesIniFile)
{
	WriteIni("[ranges]\ntarget = 172.16.0.0/12\n[monitor]\ninterval = 5\n");
	setenv("TARGET_IP_RANGES", "192.168.0.0/16", 1);
	setenv("MONITOR_INTERVAL", "nope", 1);

	auto Config = LMonitorConfig::Load(IniPath);
	ASSERT_TRUE(Config);
	EXPECT_EQ(Config->TargetIpRanges, "192.168.0.0/16");
	EXPECT_EQ(Config->Interval, LSeconds(5));
}

TEST_F(MonitorConfigTest, MissingExplicitFileFails)
{
	EXPECT_FALSE(LMonitorConfig::Load(IniPath.string() + ".missing"));
}

TEST_F(MonitorConfigTest, SearchPathsStartInWorkingDirectory)
{
	auto const Paths = LMonitorConfig::GetSearchPaths();
	ASSERT_FALSE(Paths.empty());
	EXPECT_EQ(Paths.front(), stdfs::path("./lauscher.ini"));
	EXPECT_EQ(Paths.back(), stdfs::path("/etc/lauscher/lauscher.ini"));
}
