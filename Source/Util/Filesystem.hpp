/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unistd.h>
#include <cstdlib>
#include <vector>

namespace stdfs = std::filesystem;

class LFilesystem
{
public:
	static bool Exists(stdfs::path const& p)
	{
		std::error_code Ec;
		return stdfs::exists(p, Ec);
	}

	// First line of a small text file such as /proc/<pid>/comm, without the newline
	static std::optional<std::string> ReadFirstLine(stdfs::path const& Path)
	{
		std::ifstream FileStream(Path);
		if (!FileStream)
			return std::nullopt;

		std::string Line;
		if (!std::getline(FileStream, Line))
			return std::nullopt;

		while (!Line.empty() && (Line.back() == '\n' || Line.back() == '\r'))
		{
			Line.pop_back();
		}
		return Line;
	}

	// Readlink helper that returns the symlink target as string; returns empty on failure.
	static std::string ReadLink(std::string const& Path)
	{
		std::vector<char> Buf(256);
		while (true)
		{
			ssize_t N = ::readlink(Path.c_str(), Buf.data(), Buf.size());
			if (N < 0)
			{
				return {};
			}
			if (static_cast<size_t>(N) < Buf.size())
			{
				return { Buf.data(), static_cast<size_t>(N) };
			}
			// Buffer too small, grow and retry
			Buf.resize(Buf.size() * 2);
		}
	}

	// Resolve an executable name against $PATH
	static std::optional<stdfs::path> FindExecutable(std::string const& Name)
	{
		char const* PathEnv = std::getenv("PATH");
		if (!PathEnv || PathEnv[0] == '\0')
		{
			return std::nullopt;
		}

		std::string const Paths(PathEnv);
		size_t            Start = 0;
		while (Start <= Paths.size())
		{
			size_t End = Paths.find(':', Start);
			if (End == std::string::npos)
			{
				End = Paths.size();
			}

			std::string const Dir = Paths.substr(Start, End - Start);
			if (!Dir.empty())
			{
				stdfs::path Candidate = stdfs::path(Dir) / Name;
				if (::access(Candidate.c_str(), X_OK) == 0)
				{
					return Candidate;
				}
			}
			Start = End + 1;
		}
		return std::nullopt;
	}
};
