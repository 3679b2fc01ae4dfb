// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>
#include <string>

/**
 * Obtain the full concatenated message of an exception and its
 * nested chain.
 */
[[gnu::pure]]
std::string
GetFullMessage(const std::exception &e,
	       const char *fallback="Unknown exception",
	       const char *separator="; ") noexcept;

/**
 * Obtain the full concatenated message of an exception and its
 * nested chain.
 */
[[gnu::pure]]
std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback="Unknown exception",
	       const char *separator="; ") noexcept;

/**
 * Find the first exception of the given type in the nested chain.
 * Returns nullptr if there is none.
 */
template<typename T>
[[gnu::pure]]
const T *
FindNested(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const T &t) {
		return &t;
	} catch (const std::nested_exception &ne) {
		return FindNested<T>(ne.nested_ptr());
	} catch (...) {
		return nullptr;
	}
}
