// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

enum class HttpMethod : uint_least8_t {
	HEAD,
	GET,
	POST,
};

constexpr const char *
http_method_to_string(HttpMethod method) noexcept
{
	switch (method) {
	case HttpMethod::HEAD:
		return "HEAD";

	case HttpMethod::GET:
		return "GET";

	case HttpMethod::POST:
		return "POST";
	}

	return "?";
}
