/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <utility>

#include "IProcessInfo.hpp"
#include "Filesystem.hpp"

// Process names from /proc/<pid>/comm
class LProcProcessInfo final : public IProcessInfo
{
	stdfs::path ProcRoot;

public:
	explicit LProcProcessInfo(stdfs::path ProcRoot_ = "/proc")
		: ProcRoot(std::move(ProcRoot_))
	{
	}

	std::string NameOf(LProcessId PID) override;
};
