/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <atomic>
#include <chrono>

// Stop flag shared between the monitor loop and whoever wants it to end.
// RequestStop() is a single lock-free store and may be called from a signal handler.
class LCancellation
{
	std::atomic<bool> bStop{ false };

	static_assert(std::atomic<bool>::is_always_lock_free);

public:
	static constexpr std::chrono::milliseconds PollSlice{ 100 };

	void RequestStop() noexcept { bStop.store(true, std::memory_order_relaxed); }

	[[nodiscard]] bool IsStopRequested() const noexcept { return bStop.load(std::memory_order_relaxed); }

	// Returns false if a stop was requested before Duration elapsed
	bool WaitFor(std::chrono::milliseconds Duration) const;
};
