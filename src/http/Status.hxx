// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

/**
 * The subset of HTTP status codes the ACME client needs to know by
 * name.  Any other code received from a server may be stored in a
 * variable of this type by casting.
 */
enum class HttpStatus : uint_least16_t {
	OK = 200,
	CREATED = 201,
	ACCEPTED = 202,
	NO_CONTENT = 204,

	BAD_REQUEST = 400,
	UNAUTHORIZED = 401,
	FORBIDDEN = 403,
	NOT_FOUND = 404,
	TOO_MANY_REQUESTS = 429,

	INTERNAL_SERVER_ERROR = 500,
	BAD_GATEWAY = 502,
	SERVICE_UNAVAILABLE = 503,
	GATEWAY_TIMEOUT = 504,
};

constexpr bool
http_status_is_valid(HttpStatus status) noexcept
{
	return unsigned(status) >= 100 && unsigned(status) < 600;
}

constexpr bool
http_status_is_success(HttpStatus status) noexcept
{
	return unsigned(status) >= 200 && unsigned(status) < 300;
}
