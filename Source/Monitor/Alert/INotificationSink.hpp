/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

class INotificationSink
{
public:
	virtual ~INotificationSink() = default;

	// False if the notification couldn't be delivered
	virtual bool Notify(std::string const& Title, std::string const& Message) = 0;
};

// Used when desktop notifications are turned off, the dispatcher's log line is the only output
class LLogOnlySink final : public INotificationSink
{
public:
	bool Notify(std::string const&, std::string const&) override { return true; }
};
