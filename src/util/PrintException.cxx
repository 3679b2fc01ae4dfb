// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PrintException.hxx"

#include <fmt/core.h>

#include <stdio.h>

void
PrintException(const std::exception &e) noexcept
{
	fmt::print(stderr, "{}\n", e.what());

	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		PrintException(nested);
	} catch (const char *s) {
		fmt::print(stderr, "{}\n", s);
	} catch (...) {
		fmt::print(stderr, "Unrecognized nested exception\n");
	}
}
