/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ProcNetSampler.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <utility>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"

namespace
{
	// Columns between "st" and "inode": tx_queue:rx_queue tr:tm->when retrnsmt uid timeout
	constexpr int kColumnsBeforeInode = 5;

	template <typename T>
	bool ParseHex(std::string const& Text, T& Out)
	{
		if (Text.empty())
		{
			return false;
		}
		auto Result = std::from_chars(Text.data(), Text.data() + Text.size(), Out, 16);
		return Result.ec == std::errc() && Result.ptr == Text.data() + Text.size();
	}

	std::optional<LProcessId> ParsePid(std::string const& Name)
	{
		LProcessId Pid{};
		auto       Result = std::from_chars(Name.data(), Name.data() + Name.size(), Pid);
		if (Result.ec != std::errc() || Result.ptr != Name.data() + Name.size() || Pid <= 0)
		{
			return std::nullopt;
		}
		return Pid;
	}

	std::optional<LSocketInode> ParseSocketLink(std::string const& Target)
	{
		// format: socket:[12345]
		constexpr std::string_view Prefix = "socket:[";
		if (!Target.starts_with(Prefix) || Target.back() != ']')
		{
			return std::nullopt;
		}

		LSocketInode Inode{};
		char const*  Begin = Target.data() + Prefix.size();
		char const*  End = Target.data() + Target.size() - 1;
		auto         Result = std::from_chars(Begin, End, Inode);
		if (Result.ec != std::errc() || Result.ptr != End)
		{
			return std::nullopt;
		}
		return Inode;
	}
} // namespace

LProcNetSampler::LProcNetSampler(stdfs::path ProcRoot_)
	: ProcRoot(std::move(ProcRoot_))
{
}

std::vector<LConnectionSample> LProcNetSampler::Sample()
{
	std::vector<LProcNetEntry> Entries{};

	bool const bReadV4 = ReadTable(ProcRoot / "net" / "tcp", Entries);
	bool const bReadV6 = ReadTable(ProcRoot / "net" / "tcp6", Entries);
	if (!bReadV4 && !bReadV6)
	{
		throw LSamplingError(fmt::format("can't read TCP tables under {}: {}", ProcRoot.string(), LErrnoUtil::StrError()));
	}

	std::unordered_set<LSocketInode> Inodes{};
	for (auto const& Entry : Entries)
	{
		if (Entry.State == ETcpState::Established && Entry.Inode != 0)
		{
			Inodes.insert(Entry.Inode);
		}
	}

	auto const Owners = MapInodesToProcesses(Inodes);

	std::vector<LConnectionSample> Samples{};
	Samples.reserve(Entries.size());
	for (auto const& Entry : Entries)
	{
		if (Entry.State != ETcpState::Established)
		{
			continue;
		}

		LConnectionSample Sample{ Entry.Local, Entry.Remote, std::nullopt, Entry.State };
		if (auto It = Owners.find(Entry.Inode); It != Owners.end())
		{
			Sample.PID = It->second;
		}
		Samples.push_back(Sample);
	}
	return Samples;
}

bool LProcNetSampler::ReadTable(stdfs::path const& Path, std::vector<LProcNetEntry>& OutEntries) const
{
	std::ifstream File(Path);
	if (!File.is_open())
	{
		spdlog::debug("can't open {}: {}", Path.string(), LErrnoUtil::StrError());
		return false;
	}

	std::string Line;
	std::getline(File, Line); // Skip header

	while (std::getline(File, Line))
	{
		if (auto Entry = ParseLine(Line))
		{
			OutEntries.push_back(*Entry);
		}
		else
		{
			spdlog::debug("skipping malformed line in {}: '{}'", Path.string(), Line);
		}
	}
	return true;
}

std::optional<LProcNetEntry> LProcNetSampler::ParseLine(std::string const& Line)
{
	std::istringstream Iss(Line);
	std::string        Slot, LocalAddrStr, RemAddrStr, StateStr;

	if (!(Iss >> Slot >> LocalAddrStr >> RemAddrStr >> StateStr))
	{
		return std::nullopt;
	}

	LProcNetEntry Entry{};
	if (!ParseAddressPort(LocalAddrStr, Entry.Local) || !ParseAddressPort(RemAddrStr, Entry.Remote))
	{
		return std::nullopt;
	}

	if (Entry.Local.Address.Family != Entry.Remote.Address.Family)
	{
		return std::nullopt;
	}

	uint8_t State{};
	if (!ParseHex(StateStr, State))
	{
		return std::nullopt;
	}
	Entry.State = static_cast<ETcpState::Type>(State);

	std::string Field;
	for (int i = 0; i < kColumnsBeforeInode; ++i)
	{
		if (!(Iss >> Field))
		{
			return std::nullopt;
		}
	}

	if (!(Iss >> Entry.Inode))
	{
		return std::nullopt;
	}

	return Entry;
}

bool LProcNetSampler::ParseAddressPort(std::string const& AddrPortStr, LEndpoint& OutEndpoint)
{
	size_t const ColonPos = AddrPortStr.find(':');
	if (ColonPos == std::string::npos)
		return false;

	std::string const AddrStr = AddrPortStr.substr(0, ColonPos);
	std::string const PortStr = AddrPortStr.substr(ColonPos + 1);

	// Port is always hex in host byte order
	if (PortStr.size() > 4 || !ParseHex(PortStr, OutEndpoint.Port))
		return false;

	// The kernel prints the raw in_addr words with %08X, so the byte shuffling below
	// is only right on little-endian hosts
	LIPAddress& OutAddr = OutEndpoint.Address;
	OutAddr = {};

	if (AddrStr.length() == 32)
	{
		// IPv6 address is printed as 4 32 bit words, each in host (little-endian) byte order
		for (size_t i = 0; i < 4; ++i)
		{
			uint32_t Word{};
			if (!ParseHex(AddrStr.substr(i * 8, 8), Word))
				return false;

			OutAddr.Bytes[i * 4 + 0] = static_cast<uint8_t>(Word & 0xFF);
			OutAddr.Bytes[i * 4 + 1] = static_cast<uint8_t>(Word >> 8 & 0xFF);
			OutAddr.Bytes[i * 4 + 2] = static_cast<uint8_t>(Word >> 16 & 0xFF);
			OutAddr.Bytes[i * 4 + 3] = static_cast<uint8_t>(Word >> 24 & 0xFF);
		}
		OutAddr.Family = EIPFamily::IPv6;
		return true;
	}

	if (AddrStr.length() == 8)
	{
		uint32_t Addr4{};
		if (!ParseHex(AddrStr, Addr4))
			return false;

		OutAddr.Bytes[0] = static_cast<uint8_t>(Addr4 & 0xFF);
		OutAddr.Bytes[1] = static_cast<uint8_t>(Addr4 >> 8 & 0xFF);
		OutAddr.Bytes[2] = static_cast<uint8_t>(Addr4 >> 16 & 0xFF);
		OutAddr.Bytes[3] = static_cast<uint8_t>(Addr4 >> 24 & 0xFF);
		OutAddr.Family = EIPFamily::IPv4;
		return true;
	}

	return false;
}

std::unordered_map<LSocketInode, LProcessId> LProcNetSampler::MapInodesToProcesses(
	std::unordered_set<LSocketInode> const& Wanted) const
{
	std::unordered_map<LSocketInode, LProcessId> Owners{};
	if (Wanted.empty())
	{
		return Owners;
	}

	std::error_code           Ec;
	stdfs::directory_iterator ProcIt(ProcRoot, stdfs::directory_options::skip_permission_denied, Ec);
	for (; !Ec && ProcIt != stdfs::directory_iterator(); ProcIt.increment(Ec))
	{
		auto const Pid = ParsePid(ProcIt->path().filename().string());
		if (!Pid)
		{
			continue;
		}

		// Processes exit while we scan and fd directories of other users are unreadable, both are expected
		std::error_code           FdEc;
		stdfs::directory_iterator FdIt(ProcIt->path() / "fd", FdEc);
		for (; !FdEc && FdIt != stdfs::directory_iterator(); FdIt.increment(FdEc))
		{
			auto const Inode = ParseSocketLink(LFilesystem::ReadLink(FdIt->path().string()));
			if (Inode && Wanted.contains(*Inode))
			{
				Owners.emplace(*Inode, *Pid);
			}
		}

		if (Owners.size() == Wanted.size())
		{
			break;
		}
	}

	if (Ec)
	{
		spdlog::debug("can't list {}: {}", ProcRoot.string(), Ec.message());
	}
	return Owners;
}
