// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Init.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <curl/curl.h>

static bool
DoCurlInit()
{
	const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
	if (code != CURLE_OK)
		throw FmtRuntimeError("CURL initialization failed: {}",
				      curl_easy_strerror(code));

	return true;
}

void
CurlInit()
{
	[[maybe_unused]] static const bool initialized = DoCurlInit();
}
