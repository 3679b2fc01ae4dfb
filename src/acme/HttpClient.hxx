// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/Method.hxx"
#include "http/Status.hxx"

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * Response header names are always lower case.
 */
using GlueHttpHeaders = std::multimap<std::string, std::string, std::less<>>;

/**
 * Describes one HTTP request.  A request body is only sent with
 * #HttpMethod::POST, and it is always "application/jose+json".
 */
struct GlueHttpRequest {
	HttpMethod method;

	std::string uri;

	std::string body;

	/**
	 * Zero means no limit.
	 */
	std::chrono::milliseconds connect_timeout{};

	/**
	 * The transfer is aborted if receiving (or sending) stalls for
	 * this duration.  Zero means no limit.
	 */
	std::chrono::milliseconds read_timeout{}, write_timeout{};
};

struct GlueHttpResponse {
	HttpStatus status;

	GlueHttpHeaders headers;

	std::string body;

	/**
	 * Find a response header.
	 *
	 * @param name the lower-case header name
	 * @return the value or nullptr if there is no such header
	 */
	[[gnu::pure]]
	const char *FindHeader(std::string_view name) const noexcept {
		auto i = headers.find(name);
		return i != headers.end()
			? i->second.c_str()
			: nullptr;
	}
};

/**
 * Thrown by #HttpClient when no response was received.
 */
class HttpTransportError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * A synchronous HTTP client.
 */
class HttpClient {
public:
	virtual ~HttpClient() noexcept = default;

	/**
	 * Send the request and wait for the response.
	 *
	 * Throws #HttpTransportError if the server could not be
	 * reached or the transfer failed.
	 */
	virtual GlueHttpResponse Request(const GlueHttpRequest &request) = 0;
};
