// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "HttpClient.hxx"
#include "io/Logger.hxx"

#include <chrono>
#include <functional>

/**
 * Sends ACME requests with a bounded number of immediate retries.
 */
class AcmeCaller {
	HttpClient &client;

	const LLogger logger{"acme"};

public:
	static constexpr unsigned MAX_ATTEMPTS = 3;

	/**
	 * The connect, read and write timeout applied to each
	 * attempt.
	 */
	static constexpr std::chrono::seconds TIMEOUT{30};

	explicit AcmeCaller(HttpClient &_client) noexcept
		:client(_client) {}

	/**
	 * Send a request until it succeeds.
	 *
	 * The function is invoked once per attempt and must return a
	 * newly built request; a signed request must contain a fresh
	 * nonce each time, because a nonce is never accepted twice.
	 * Exceptions thrown by it are not retried.
	 *
	 * A "400 Bad Request" is not retried and throws AcmeError
	 * with kind TERMINAL_CALL.  Other failures (transport errors
	 * and non-2xx statuses) are retried immediately; after
	 * #MAX_ATTEMPTS failed attempts, AcmeError with kind NETWORK
	 * is thrown, carrying the last status and body.
	 *
	 * @return the (successful) response
	 */
	GlueHttpResponse Execute(const std::function<GlueHttpRequest()> &make_request);

	/**
	 * Send a request without body.
	 */
	GlueHttpResponse Execute(HttpMethod method, const char *uri);

private:
	static void Configure(GlueHttpRequest &request) noexcept;
};
