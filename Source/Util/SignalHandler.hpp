/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

class LCancellation;

// Routes SIGINT/SIGTERM to a cancellation token
class LSignalHandler
{
public:
	static void Install(LCancellation& Token);
	static void Uninstall();
};
