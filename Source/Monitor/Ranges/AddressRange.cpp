/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "AddressRange.hpp"

#include <bit>
#include <charconv>

#include "StringUtil.hpp"

namespace
{
	// Compares the first PrefixLength bits of A and B
	bool PrefixEquals(std::array<uint8_t, 16> const& A, std::array<uint8_t, 16> const& B, uint8_t PrefixLength)
	{
		size_t const FullBytes = PrefixLength / 8;
		for (size_t i = 0; i < FullBytes; ++i)
		{
			if (A[i] != B[i])
				return false;
		}

		uint8_t const RemainingBits = PrefixLength % 8;
		if (RemainingBits == 0)
		{
			return true;
		}

		auto const Mask = static_cast<uint8_t>(0xFF << (8 - RemainingBits));
		return (A[FullBytes] & Mask) == (B[FullBytes] & Mask);
	}

	bool HasHostBits(LIPAddress const& Address, uint8_t PrefixLength)
	{
		size_t const ByteCount = Address.GetByteCount();
		for (size_t i = 0; i < ByteCount; ++i)
		{
			size_t const BitOffset = i * 8;
			uint8_t      HostMask = 0xFF;
			if (BitOffset + 8 <= PrefixLength)
			{
				HostMask = 0x00;
			}
			else if (BitOffset < PrefixLength)
			{
				HostMask = static_cast<uint8_t>(0xFF >> (PrefixLength - BitOffset));
			}

			if ((Address.Bytes[i] & HostMask) != 0)
				return true;
		}
		return false;
	}

	// "255.255.0.0" netmask or "0.0.255.255" hostmask to a prefix length, IPv4 only
	std::optional<unsigned> MaskToPrefix(std::string_view MaskText)
	{
		auto Mask = LIPAddress::FromString(std::string(MaskText));
		if (!Mask || Mask->Family != EIPFamily::IPv4)
		{
			return std::nullopt;
		}

		uint32_t const Bits = static_cast<uint32_t>(Mask->Bytes[0]) << 24 | static_cast<uint32_t>(Mask->Bytes[1]) << 16
			| static_cast<uint32_t>(Mask->Bytes[2]) << 8 | Mask->Bytes[3];

		auto LeadingOnes = [](uint32_t Value) -> std::optional<unsigned> {
			unsigned const Ones = static_cast<unsigned>(std::countl_one(Value));
			if (Ones < 32 && (Value << Ones) != 0)
			{
				return std::nullopt;
			}
			return Ones;
		};

		if (auto Prefix = LeadingOnes(Bits))
		{
			return Prefix;
		}
		return LeadingOnes(~Bits);
	}
} // namespace

std::optional<LAddressRange> LAddressRange::Parse(std::string_view Text)
{
	std::string_view const Trimmed = LStringUtil::Trim(Text);
	if (Trimmed.empty())
	{
		return std::nullopt;
	}

	size_t const           SlashPos = Trimmed.find('/');
	std::string_view const AddressText = Trimmed.substr(0, SlashPos);

	auto Address = LIPAddress::FromString(std::string(AddressText));
	if (!Address)
	{
		return std::nullopt;
	}

	auto const MaxPrefix = static_cast<unsigned>(Address->GetByteCount() * 8);
	unsigned   Prefix = MaxPrefix;

	if (SlashPos != std::string_view::npos)
	{
		std::string_view const PrefixText = Trimmed.substr(SlashPos + 1);
		if (Address->Family == EIPFamily::IPv4 && PrefixText.find('.') != std::string_view::npos)
		{
			auto MaskPrefix = MaskToPrefix(PrefixText);
			if (!MaskPrefix)
			{
				return std::nullopt;
			}
			Prefix = *MaskPrefix;
		}
		else
		{
			if (!LStringUtil::IsDigits(PrefixText) || PrefixText.size() > 3)
			{
				return std::nullopt;
			}

			auto Result = std::from_chars(PrefixText.data(), PrefixText.data() + PrefixText.size(), Prefix);
			if (Result.ec != std::errc() || Prefix > MaxPrefix)
			{
				return std::nullopt;
			}
		}
	}

	if (HasHostBits(*Address, static_cast<uint8_t>(Prefix)))
	{
		return std::nullopt;
	}

	// ::ffff:a.b.c.d/n covers the same peers as a.b.c.d/(n - 96), peers are matched as IPv4
	if (Address->IsIPv4Mapped() && Prefix >= 96)
	{
		return LAddressRange(Address->Normalized(), static_cast<uint8_t>(Prefix - 96));
	}

	return LAddressRange(*Address, static_cast<uint8_t>(Prefix));
}

bool LAddressRange::Contains(LIPAddress const& Address) const
{
	if (Address.Family != Network.Family)
	{
		return false;
	}
	return PrefixEquals(Network.Bytes, Address.Bytes, PrefixLength);
}

std::string LAddressRange::ToString() const
{
	return Network.ToString() + "/" + std::to_string(PrefixLength);
}
