/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "Types.hpp"

class IProcessInfo
{
public:
	static constexpr char const* UnknownName = "Unknown";

	virtual ~IProcessInfo() = default;

	// Never fails, returns UnknownName if the process is gone or can't be inspected
	virtual std::string NameOf(LProcessId PID) = 0;
};
