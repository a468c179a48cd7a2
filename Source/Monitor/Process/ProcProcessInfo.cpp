/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ProcProcessInfo.hpp"

#include <spdlog/spdlog.h>

std::string LProcProcessInfo::NameOf(LProcessId PID)
{
	if (PID <= 0)
	{
		return UnknownName;
	}

	auto Name = LFilesystem::ReadFirstLine(ProcRoot / std::to_string(PID) / "comm");
	if (!Name || Name->empty())
	{
		spdlog::debug("no name for process {}, it probably exited", PID);
		return UnknownName;
	}
	return *Name;
}
