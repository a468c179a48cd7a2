/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cerrno>
#include <cstring>
#include <string>

class LErrnoUtil
{
public:
	static std::string StrError() { return StrError(errno); }

	static std::string StrError(int Errno) { return FormatErrno(Errno); }

private:
	static std::string FormatErrno(int Errno)
	{
		char Buffer[256]{};
		// GNU strerror_r may return a static string instead of filling the buffer
		return { strerror_r(Errno, Buffer, sizeof(Buffer)) };
	}
};
