/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <cstdlib>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <unistd.h>
#include <spdlog/spdlog.h>

#include "Cancellation.hpp"
#include "Monitor.hpp"
#include "MonitorConfig.hpp"
#include "SignalHandler.hpp"
#include "Startup.hpp"
#include "Alert/AlertDispatcher.hpp"
#include "Alert/NotifySendSink.hpp"
#include "Net/ProcNetSampler.hpp"
#include "Process/ProcProcessInfo.hpp"

#ifndef LAUSCHER_VERSION
	#define LAUSCHER_VERSION "unknown"
#endif

namespace
{
	void PrintUsage(char const* Program)
	{
		fmt::print("usage: {} [config.ini]\n\n"
				   "Alerts on established TCP connections to monitored IP ranges.\n"
				   "Environment: TARGET_IP_RANGES, EXCLUDE_IP_RANGES, MONITOR_INTERVAL, LAUSCHER_LOG_LEVEL\n",
			Program);
	}
} // namespace

int main(int argc, char** argv)
{
	if (std::getenv("INVOCATION_ID") != nullptr)
	{
		// Running under systemd so we don't need the timestamp from spdlog
		spdlog::set_pattern("[%^%l%$] %v");
	}

	std::optional<stdfs::path> ConfigPath{};
	if (argc > 1)
	{
		std::string_view const Arg(argv[1]);
		if (Arg == "-h" || Arg == "--help" || argc > 2)
		{
			PrintUsage(argv[0]);
			return Arg == "-h" || Arg == "--help" ? EExitCode::Ok : EExitCode::ConfigError;
		}
		ConfigPath = stdfs::path(Arg);
	}

	spdlog::info("Lauscher {} starting", LAUSCHER_VERSION);

	auto Config = LMonitorConfig::Load(ConfigPath);
	if (!Config)
	{
		spdlog::critical("can't load configuration file {}", ConfigPath->string());
		return EExitCode::ConfigError;
	}
	spdlog::set_level(spdlog::level::from_str(Config->LogLevel));
	Config->LogConfig();

	std::optional<LRangeMatcher> Matcher{};
	if (EExitCode::Type const Code = LStartup::PrepareMatcher(*Config, Matcher); Code != EExitCode::Ok)
	{
		return Code;
	}

	if (geteuid() != 0)
	{
		spdlog::warn("Running without root privileges, some connections can't be attributed to a process");
	}

	std::shared_ptr<INotificationSink> Sink{};
	if (Config->bNotificationsEnabled)
	{
		if (!LNotifySendSink::IsAvailable())
		{
			spdlog::warn("{} not found in PATH, desktop notifications will fail", LNotifySendSink::Executable);
		}
		Sink = std::make_shared<LNotifySendSink>(Config->NotificationUrgency, Config->NotificationIcon);
	}
	else
	{
		Sink = std::make_shared<LLogOnlySink>();
	}

	LMonitor Monitor(std::move(*Matcher),
		std::make_shared<LProcNetSampler>(),
		std::make_shared<LProcProcessInfo>(),
		std::chrono::duration_cast<std::chrono::milliseconds>(Config->Interval));

	LAlertDispatcher Dispatcher(Sink, Config->NotificationTitle);
	Dispatcher.Attach(Monitor.OnAlert);

	LCancellation Stop{};
	LSignalHandler::Install(Stop);
	spdlog::info("Press Ctrl+C to stop");

	EMonitorExit::Type const Result = Monitor.Run(Stop);
	LSignalHandler::Uninstall();

	spdlog::info("Stopping network monitor after {} cycle(s): {} alert(s), {} failed notification(s), {} failed sample(s)",
		Monitor.GetCycleCount(),
		Monitor.GetAlertCount(),
		Dispatcher.GetFailedCount(),
		Monitor.GetFailedSampleCount());

	return LStartup::ToExitCode(Result);
}
