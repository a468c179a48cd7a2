/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "IPAddress.hpp"

// A CIDR block, network address + prefix length. Immutable once parsed.
class LAddressRange
{
	LIPAddress Network{};
	uint8_t    PrefixLength{};

	LAddressRange(LIPAddress const& Network_, uint8_t PrefixLength_)
		: Network(Network_)
		, PrefixLength(PrefixLength_)
	{
	}

public:
	// Accepts "a.b.c.d/n", "a.b.c.d/<netmask|hostmask>", "<ipv6>/n" and bare addresses (host ranges).
	// IPv4-mapped IPv6 ranges of /96 or longer are stored as the IPv4 range they cover.
	// Rejects anything else, including ranges with host bits set ("10.10.0.0/8").
	[[nodiscard]] static std::optional<LAddressRange> Parse(std::string_view Text);

	// False for addresses of the other family
	[[nodiscard]] bool Contains(LIPAddress const& Address) const;

	[[nodiscard]] LIPAddress const& GetNetwork() const { return Network; }
	[[nodiscard]] uint8_t           GetPrefixLength() const { return PrefixLength; }
	[[nodiscard]] EIPFamily::Type   GetFamily() const { return Network.Family; }

	[[nodiscard]] std::string ToString() const;

	friend bool operator==(LAddressRange const& Lhs, LAddressRange const& Rhs)
	{
		return Lhs.Network == Rhs.Network && Lhs.PrefixLength == Rhs.PrefixLength;
	}
};
