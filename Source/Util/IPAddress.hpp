/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <array>
#include <string>
#include <cstring>
#include <functional>
#include <optional>
#include <arpa/inet.h>
#include <netinet/in.h>

#include "Types.hpp"

namespace EIPFamily
{
	enum Type : uint8_t
	{
		Unknown = 0,
		IPv4 = 4,
		IPv6 = 6
	};
} // namespace EIPFamily

struct LIPAddress
{
	// IPv4: first 4 bytes used; IPv6: all 16 bytes used. Network byte order.
	std::array<uint8_t, 16> Bytes{};
	EIPFamily::Type         Family{};

	[[nodiscard]] static std::optional<LIPAddress> FromString(std::string const& Text)
	{
		LIPAddress Result{};
		in_addr    Addr4{};
		if (inet_pton(AF_INET, Text.c_str(), &Addr4) == 1)
		{
			std::memcpy(Result.Bytes.data(), &Addr4.s_addr, 4);
			Result.Family = EIPFamily::IPv4;
			return Result;
		}

		in6_addr Addr6{};
		if (inet_pton(AF_INET6, Text.c_str(), &Addr6) == 1)
		{
			std::memcpy(Result.Bytes.data(), Addr6.s6_addr, 16);
			Result.Family = EIPFamily::IPv6;
			return Result;
		}

		return std::nullopt;
	}

	[[nodiscard]] static LIPAddress FromIPv4(uint8_t A, uint8_t B, uint8_t C, uint8_t D)
	{
		LIPAddress Result{};
		Result.Bytes[0] = A;
		Result.Bytes[1] = B;
		Result.Bytes[2] = C;
		Result.Bytes[3] = D;
		Result.Family = EIPFamily::IPv4;
		return Result;
	}

	[[nodiscard]] size_t GetByteCount() const
	{
		if (Family == EIPFamily::IPv4)
		{
			return 4;
		}
		return Family == EIPFamily::IPv6 ? 16 : 0;
	}

	[[nodiscard]] std::string ToString() const
	{
		if (Family == EIPFamily::IPv4)
		{
			in_addr Addr4{};
			std::memcpy(&Addr4.s_addr, Bytes.data(), 4);
			char        Buffer[INET_ADDRSTRLEN];
			char const* Result = inet_ntop(AF_INET, &Addr4, Buffer, INET_ADDRSTRLEN);
			if (Result)
			{
				return { Buffer };
			}
			return {};
		}

		if (Family == EIPFamily::IPv6)
		{
			in6_addr Addr6{};
			std::memcpy(Addr6.s6_addr, Bytes.data(), 16);
			char        Buffer[INET6_ADDRSTRLEN];
			char const* Result = inet_ntop(AF_INET6, &Addr6, Buffer, INET6_ADDRSTRLEN);
			if (Result)
			{
				return { Buffer };
			}
		}
		return {};
	}

	[[nodiscard]] bool IsUnspecified() const
	{
		for (size_t i = 0; i < GetByteCount(); ++i)
		{
			if (Bytes[i] != 0)
				return false;
		}
		return true;
	}

	// ::ffff:a.b.c.d, what tcp6 sockets report for IPv4 peers
	[[nodiscard]] bool IsIPv4Mapped() const
	{
		if (Family != EIPFamily::IPv6)
		{
			return false;
		}

		for (size_t i = 0; i < 10; ++i)
		{
			if (Bytes[i] != 0)
				return false;
		}
		return Bytes[10] == 0xFF && Bytes[11] == 0xFF;
	}

	// Returns the plain IPv4 address for IPv4-mapped IPv6 addresses, otherwise a copy
	[[nodiscard]] LIPAddress Normalized() const
	{
		if (!IsIPv4Mapped())
		{
			return *this;
		}
		return FromIPv4(Bytes[12], Bytes[13], Bytes[14], Bytes[15]);
	}
};

inline bool operator==(LIPAddress const& Lhs, LIPAddress const& Rhs)
{
	return Lhs.Bytes == Rhs.Bytes && Lhs.Family == Rhs.Family;
}

inline bool operator!=(LIPAddress const& Lhs, LIPAddress const& Rhs)
{
	return !(Lhs == Rhs);
}

struct LEndpoint
{
	LIPAddress Address{};
	LPort      Port{};

	[[nodiscard]] std::string ToString() const
	{
		if (Address.Family == EIPFamily::IPv6)
		{
			return "[" + Address.ToString() + "]:" + std::to_string(Port);
		}
		return Address.ToString() + ":" + std::to_string(Port);
	}
};

inline bool operator==(LEndpoint const& Lhs, LEndpoint const& Rhs)
{
	return Lhs.Address == Rhs.Address && Lhs.Port == Rhs.Port;
}

inline bool operator!=(LEndpoint const& Lhs, LEndpoint const& Rhs)
{
	return !(Lhs == Rhs);
}

struct ByteArray16Hash
{
	size_t operator()(std::array<uint8_t, 16> const& A) const noexcept
	{
		uint64_t P1, P2;
		std::memcpy(&P1, A.data(), 8);
		std::memcpy(&P2, A.data() + 8, 8);
		uint64_t Hash = P1 ^ (P2 + 0x9e3779b97f4a7c15ULL + (P1 << 6) + (P1 >> 2));
		return Hash;
	}
};

struct LEndpointHash
{
	size_t operator()(LEndpoint const& Endpoint) const noexcept
	{
		ByteArray16Hash ByteArrayHash;

		size_t H1 = ByteArrayHash(Endpoint.Address.Bytes);
		size_t H2 = std::hash<uint8_t>{}(Endpoint.Address.Family);
		size_t H3 = std::hash<uint16_t>{}(Endpoint.Port);
		size_t Combined = H1;
		Combined = Combined * 31 + H2;
		Combined = Combined * 31 + H3;
		return Combined;
	}
};

namespace std
{
	template <>
	struct hash<LEndpoint>
	{
		size_t operator()(LEndpoint const& Endpoint) const noexcept
		{
			LEndpointHash Hash;
			return Hash(Endpoint);
		}
	};
} // namespace std
