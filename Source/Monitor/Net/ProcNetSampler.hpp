/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "IConnectionSampler.hpp"
#include "Filesystem.hpp"

struct LProcNetEntry
{
	LEndpoint       Local{};
	LEndpoint       Remote{};
	ETcpState::Type State{ ETcpState::Unknown };
	LSocketInode    Inode{};
};

// Reads the kernel's TCP tables from /proc/net/{tcp,tcp6} and attributes sockets
// to processes by scanning /proc/<pid>/fd for "socket:[inode]" links.
// Without root most foreign sockets can't be attributed, their PID stays empty.
class LProcNetSampler final : public IConnectionSampler
{
	stdfs::path ProcRoot;

	bool ReadTable(stdfs::path const& Path, std::vector<LProcNetEntry>& OutEntries) const;

	[[nodiscard]] std::unordered_map<LSocketInode, LProcessId> MapInodesToProcesses(
		std::unordered_set<LSocketInode> const& Wanted) const;

public:
	explicit LProcNetSampler(stdfs::path ProcRoot_ = "/proc");

	std::vector<LConnectionSample> Sample() override;

	// Parse one data line of /proc/net/tcp or /proc/net/tcp6
	[[nodiscard]] static std::optional<LProcNetEntry> ParseLine(std::string const& Line);

	// Parse hex address:port as printed by the kernel, IPv6 is detected by the address length
	static bool ParseAddressPort(std::string const& AddrPortStr, LEndpoint& OutEndpoint);
};
