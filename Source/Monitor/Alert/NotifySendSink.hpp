/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "INotificationSink.hpp"

// Desktop notifications through notify-send(1).
// When running as root the notification is sent as the invoking user (SUDO_USER or USER)
// on DISPLAY :0, otherwise root's session would get it.
class LNotifySendSink final : public INotificationSink
{
	std::string Urgency;
	std::string Icon;

public:
	static constexpr char const* Executable = "notify-send";

	LNotifySendSink(std::string Urgency_, std::string Icon_);

	bool Notify(std::string const& Title, std::string const& Message) override;

	[[nodiscard]] static bool IsAvailable();

	// Full argv for a notification, exposed for tests
	[[nodiscard]] std::vector<std::string> BuildCommand(
		std::string const& Title, std::string const& Message, std::optional<std::string> const& RunAsUser) const;

	// Desktop user to notify when running as root, empty if we aren't root or there is none
	[[nodiscard]] static std::optional<std::string> GetDesktopUser();

private:
	static bool Execute(std::vector<std::string> const& Argv);
};
