/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>

#include "IPAddress.hpp"
#include "Types.hpp"

// TCP states as numbered by the kernel (include/net/tcp_states.h)
namespace ETcpState
{
	enum Type : uint8_t
	{
		Unknown = 0,
		Established = 0x01,
		SynSent = 0x02,
		SynRecv = 0x03,
		FinWait1 = 0x04,
		FinWait2 = 0x05,
		TimeWait = 0x06,
		Close = 0x07,
		CloseWait = 0x08,
		LastAck = 0x09,
		Listen = 0x0A,
		Closing = 0x0B
	};
} // namespace ETcpState

// One row of the connection table, produced fresh every cycle
struct LConnectionSample
{
	LEndpoint                 Local{};
	LEndpoint                 Remote{};
	std::optional<LProcessId> PID{};
	ETcpState::Type           State{ ETcpState::Unknown };

	[[nodiscard]] bool IsEstablished() const { return State == ETcpState::Established; }
};

// Identity used for alert deduplication: remote address + remote port
using LEndpointKey = LEndpoint;

inline LEndpointKey MakeEndpointKey(LConnectionSample const& Sample)
{
	return { Sample.Remote.Address.Normalized(), Sample.Remote.Port };
}
