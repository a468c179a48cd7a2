/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <sys/types.h>
#include <cstdint>
#include <chrono>

using LProcessId = pid_t;
using LSocketInode = uint64_t;
using LPort = uint16_t; // host byte order
using LSeconds = std::chrono::seconds;
using LWallClock = std::chrono::system_clock;
using LTimestamp = LWallClock::time_point;
