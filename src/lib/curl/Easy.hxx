// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "lib/fmt/RuntimeError.hxx"

#include <curl/curl.h>

#include <chrono>
#include <cstddef>
#include <utility>

/**
 * An OO wrapper for a "CURL*" (a libCURL "easy" handle).
 */
class CurlEasy {
	CURL *handle = nullptr;

public:
	/**
	 * Allocate a new CURL*.
	 *
	 * Throws on error.
	 */
	CurlEasy()
		:handle(curl_easy_init())
	{
		if (handle == nullptr)
			throw std::runtime_error("curl_easy_init() failed");
	}

	explicit CurlEasy(const char *url)
		:CurlEasy()
	{
		SetURL(url);
	}

	CurlEasy(CurlEasy &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~CurlEasy() noexcept {
		if (handle != nullptr)
			curl_easy_cleanup(handle);
	}

	CurlEasy &operator=(CurlEasy &&src) noexcept {
		std::swap(handle, src.handle);
		return *this;
	}

	CURL *Get() noexcept {
		return handle;
	}

	template<typename T>
	void SetOption(CURLoption option, T value) {
		CURLcode code = curl_easy_setopt(handle, option, value);
		if (code != CURLE_OK)
			throw FmtRuntimeError("Failed to set CURL option: {}",
					      curl_easy_strerror(code));
	}

	void SetURL(const char *value) {
		SetOption(CURLOPT_URL, value);
	}

	void SetErrorBuffer(char *buf) {
		SetOption(CURLOPT_ERRORBUFFER, buf);
	}

	void SetRequestHeaders(struct curl_slist *headers) {
		SetOption(CURLOPT_HTTPHEADER, headers);
	}

	void SetHeaderFunction(size_t (*function)(char *buffer, size_t size,
						  size_t nitems,
						  void *userdata),
			       void *userdata) {
		SetOption(CURLOPT_HEADERFUNCTION, function);
		SetOption(CURLOPT_HEADERDATA, userdata);
	}

	void SetWriteFunction(size_t (*function)(char *ptr, size_t size,
						 size_t nmemb, void *userdata),
			      void *userdata) {
		SetOption(CURLOPT_WRITEFUNCTION, function);
		SetOption(CURLOPT_WRITEDATA, userdata);
	}

	void SetNoProgress(bool value=true) {
		SetOption(CURLOPT_NOPROGRESS, long(value));
	}

	void SetNoSignal(bool value=true) {
		SetOption(CURLOPT_NOSIGNAL, long(value));
	}

	void SetVerbose(bool value=true) {
		SetOption(CURLOPT_VERBOSE, long(value));
	}

	void SetConnectTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_CONNECTTIMEOUT_MS, long(timeout.count()));
	}

	/**
	 * Abort the transfer if it stalls (i.e. less than one byte
	 * per second) for the given duration.
	 */
	void SetStallTimeout(std::chrono::seconds timeout) {
		SetOption(CURLOPT_LOW_SPEED_LIMIT, 1L);
		SetOption(CURLOPT_LOW_SPEED_TIME, long(timeout.count()));
	}

	void SetNoBody(bool value=true) {
		SetOption(CURLOPT_NOBODY, long(value));
	}

	void SetPost(bool value=true) {
		SetOption(CURLOPT_POST, long(value));
	}

	void SetRequestBody(const void *data, std::size_t size) {
		SetOption(CURLOPT_POSTFIELDS, data);
		SetOption(CURLOPT_POSTFIELDSIZE, long(size));
	}

	void SetCAInfo(const char *path) {
		SetOption(CURLOPT_CAINFO, path);
	}

	CURLcode Perform() noexcept {
		return curl_easy_perform(handle);
	}

	[[gnu::pure]]
	long GetResponseCode() const noexcept {
		long value;
		return curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &value) == CURLE_OK
			? value
			: -1;
	}
};
