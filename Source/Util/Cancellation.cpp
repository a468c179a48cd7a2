/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Cancellation.hpp"

#include <algorithm>
#include <thread>

bool LCancellation::WaitFor(std::chrono::milliseconds Duration) const
{
	auto const Deadline = std::chrono::steady_clock::now() + Duration;

	while (!IsStopRequested())
	{
		auto const Now = std::chrono::steady_clock::now();
		if (Now >= Deadline)
		{
			return true;
		}

		auto const Remaining = std::chrono::duration_cast<std::chrono::milliseconds>(Deadline - Now);
		std::this_thread::sleep_for(std::min(Remaining, PollSlice));
	}
	return false;
}
