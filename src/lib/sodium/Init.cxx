// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Init.hxx"

#include <sodium/core.h>

#include <stdexcept>

static bool
DoSodiumInit()
{
	if (sodium_init() < 0)
		throw std::runtime_error("sodium_init() failed");

	return true;
}

void
SodiumInit()
{
	[[maybe_unused]] static const bool initialized = DoSodiumInit();
}
