/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <chrono>
#include <csignal>
#include <thread>
#include <gtest/gtest.h>

#include "Cancellation.hpp"
#include "SignalHandler.hpp"

using namespace std::chrono_literals;

TEST(Cancellation, WaitForElapsesWithoutStop)
{
	LCancellation Stop;
	auto const    Start = std::chrono::steady_clock::now();
	EXPECT_TRUE(Stop.WaitFor(30ms));
	EXPECT_GE(std::chrono::steady_clock::now() - Start, 30ms);
}

TEST(Cancellation, WaitForReturnsEarlyOnStop)
{
	LCancellation Stop;
	std::thread   Stopper([&] {
		std::this_thread::sleep_for(20ms);
		Stop.RequestStop();
	});

	auto const Start = std::chrono::steady_clock::now();
	EXPECT_FALSE(Stop.WaitFor(10s));
	EXPECT_LT(std::chrono::steady_clock::now() - Start, 5s);
	Stopper.join();
}

TEST(Cancellation, AlreadyStoppedDoesNotWait)
{
	LCancellation Stop;
	Stop.RequestStop();
	EXPECT_TRUE(Stop.IsStopRequested());
	EXPECT_FALSE(Stop.WaitFor(10s));
}

TEST(SignalHandler, SigtermRequestsStop)
{
	LCancellation Stop;
	LSignalHandler::Install(Stop);
	std::raise(SIGTERM);
	EXPECT_TRUE(Stop.IsStopRequested());
	LSignalHandler::Uninstall();
}
