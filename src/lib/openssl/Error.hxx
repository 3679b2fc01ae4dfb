// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

/**
 * An OpenSSL error.  The message is composed of the given prefix and
 * the most recent entry of the OpenSSL error queue, which is cleared.
 */
class SslError final : public std::runtime_error {
public:
	explicit SslError(const char *msg="");
};
