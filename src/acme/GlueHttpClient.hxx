// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "HttpClient.hxx"

class CurlSlist;
class CurlEasy;

/**
 * #HttpClient implementation using libCURL.
 */
class GlueHttpClient final : public HttpClient {
	const char *const tls_ca;

	bool verbose = false;

public:
	/**
	 * Throws on error (e.g. if CURL initialization fails).
	 *
	 * @param _tls_ca a file containing the CA certificates to be
	 * accepted; nullptr to use the system default
	 */
	explicit GlueHttpClient(const char *_tls_ca);

	GlueHttpClient(const GlueHttpClient &) = delete;
	GlueHttpClient &operator=(const GlueHttpClient &) = delete;

	void EnableVerbose() noexcept {
		verbose = true;
	}

	/* virtual methods from class HttpClient */
	GlueHttpResponse Request(const GlueHttpRequest &request) override;

private:
	CurlEasy PrepareRequest(const GlueHttpRequest &request,
				CurlSlist &header_list);
};
