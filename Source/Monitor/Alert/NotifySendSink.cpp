/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "NotifySendSink.hpp"

#include <cerrno>
#include <cstdlib>
#include <string_view>
#include <utility>
#include <sys/wait.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"
#include "Filesystem.hpp"

LNotifySendSink::LNotifySendSink(std::string Urgency_, std::string Icon_)
	: Urgency(std::move(Urgency_))
	, Icon(std::move(Icon_))
{
}

bool LNotifySendSink::Notify(std::string const& Title, std::string const& Message)
{
	return Execute(BuildCommand(Title, Message, GetDesktopUser()));
}

bool LNotifySendSink::IsAvailable()
{
	return LFilesystem::FindExecutable(Executable).has_value();
}

std::vector<std::string> LNotifySendSink::BuildCommand(
	std::string const& Title, std::string const& Message, std::optional<std::string> const& RunAsUser) const
{
	std::vector<std::string> Argv{};
	if (RunAsUser)
	{
		Argv = { "sudo", "-u", *RunAsUser, "DISPLAY=:0" };
	}

	Argv.emplace_back(Executable);
	Argv.emplace_back("--urgency=" + Urgency);
	Argv.emplace_back("--icon=" + Icon);
	Argv.push_back(Title);
	Argv.push_back(Message);
	return Argv;
}

std::optional<std::string> LNotifySendSink::GetDesktopUser()
{
	if (geteuid() != 0)
	{
		return std::nullopt;
	}

	char const* User = std::getenv("SUDO_USER");
	if (!User || User[0] == '\0')
	{
		User = std::getenv("USER");
	}

	if (!User || User[0] == '\0' || std::string_view(User) == "root")
	{
		return std::nullopt;
	}
	return std::string(User);
}

bool LNotifySendSink::Execute(std::vector<std::string> const& Argv)
{
	std::vector<char*> CArgs{};
	CArgs.reserve(Argv.size() + 1);
	for (auto const& Arg : Argv)
	{
		CArgs.push_back(const_cast<char*>(Arg.c_str()));
	}
	CArgs.push_back(nullptr);

	pid_t const Pid = fork();
	if (Pid == -1)
	{
		spdlog::error("fork() for {} failed: {}", Argv.front(), LErrnoUtil::StrError());
		return false;
	}

	if (Pid == 0)
	{
		// No shell, arguments go to the program as they are
		execvp(CArgs[0], CArgs.data());
		_exit(127);
	}

	int Status = 0;
	while (waitpid(Pid, &Status, 0) == -1)
	{
		if (errno != EINTR)
		{
			spdlog::error("waitpid() for {} failed: {}", Argv.front(), LErrnoUtil::StrError());
			return false;
		}
	}

	if (!WIFEXITED(Status) || WEXITSTATUS(Status) != 0)
	{
		spdlog::debug("{} exited with status {}", Argv.front(), WIFEXITED(Status) ? WEXITSTATUS(Status) : -1);
		return false;
	}
	return true;
}
