// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <openssl/err.h>

#include <string>

static std::string
FormatSslError(const char *msg)
{
	std::string result(msg);

	const unsigned long code = ERR_get_error();
	ERR_clear_error();

	if (code != 0) {
		char buffer[256];
		ERR_error_string_n(code, buffer, sizeof(buffer));

		if (!result.empty())
			result += ": ";
		result += buffer;
	}

	return result;
}

SslError::SslError(const char *msg)
	:std::runtime_error(FormatSslError(msg))
{
}
