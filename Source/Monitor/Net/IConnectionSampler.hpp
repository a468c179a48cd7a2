/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <stdexcept>
#include <vector>

#include "ConnectionSample.hpp"

// Thrown when the connection table can't be enumerated at all
class LSamplingError : public std::runtime_error
{
public:
	using std::runtime_error::runtime_error;
};

class IConnectionSampler
{
public:
	virtual ~IConnectionSampler() = default;

	// Established connections at the time of the call
	virtual std::vector<LConnectionSample> Sample() = 0;
};
