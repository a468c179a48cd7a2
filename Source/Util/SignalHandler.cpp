/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SignalHandler.hpp"

#include <atomic>
#include <csignal>

#include "Cancellation.hpp"

static std::atomic<LCancellation*> GSignalToken{ nullptr };

static void OnSigint(int)
{
	if (LCancellation* Token = GSignalToken.load())
	{
		Token->RequestStop();
	}
}

void LSignalHandler::Install(LCancellation& Token)
{
	GSignalToken = &Token;
	signal(SIGINT, OnSigint);
	signal(SIGTERM, OnSigint);
}

void LSignalHandler::Uninstall()
{
	signal(SIGINT, SIG_DFL);
	signal(SIGTERM, SIG_DFL);
	GSignalToken = nullptr;
}
