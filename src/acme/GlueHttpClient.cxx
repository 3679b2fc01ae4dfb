// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "GlueHttpClient.hxx"
#include "lib/curl/Easy.hxx"
#include "lib/curl/Init.hxx"
#include "lib/curl/Slist.hxx"

#include <fmt/core.h>

#include <algorithm>

#include <string.h>

using std::string_view_literals::operator""sv;

class GlueHttpResponseHandler final {
	GlueHttpHeaders headers;

	std::string body;

public:
	GlueHttpResponse MoveResponse(HttpStatus status) noexcept {
		return {status, std::move(headers), std::move(body)};
	}

	void OnHeaderLine(std::string_view line) noexcept;

	static size_t HeaderFunction(char *buffer, size_t size,
				     size_t nitems, void *userdata) noexcept;

	static size_t WriteFunction(char *ptr, size_t size,
				    size_t nmemb, void *userdata) noexcept;
};

static constexpr std::string_view
StripRight(std::string_view s) noexcept
{
	while (!s.empty() && (s.back() == '\r' || s.back() == '\n' ||
			      s.back() == ' ' || s.back() == '\t'))
		s.remove_suffix(1);
	return s;
}

static constexpr std::string_view
StripLeft(std::string_view s) noexcept
{
	while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
		s.remove_prefix(1);
	return s;
}

static constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z'
		? char(ch - 'A' + 'a')
		: ch;
}

inline void
GlueHttpResponseHandler::OnHeaderLine(std::string_view line) noexcept
{
	line = StripRight(line);

	if (line.starts_with("HTTP/"sv)) {
		/* a new status line (after a redirect or "100
		   Continue"): discard the headers collected so
		   far */
		headers.clear();
		return;
	}

	const auto colon = line.find(':');
	if (colon == line.npos || colon == 0)
		return;

	std::string name{line.substr(0, colon)};
	std::transform(name.begin(), name.end(), name.begin(), ToLowerASCII);

	headers.emplace(std::move(name),
			std::string{StripLeft(line.substr(colon + 1))});
}

size_t
GlueHttpResponseHandler::HeaderFunction(char *buffer, size_t size,
					size_t nitems, void *userdata) noexcept
{
	auto &handler = *(GlueHttpResponseHandler *)userdata;
	const size_t length = size * nitems;
	handler.OnHeaderLine({buffer, length});
	return length;
}

size_t
GlueHttpResponseHandler::WriteFunction(char *ptr, size_t size,
				       size_t nmemb, void *userdata) noexcept
{
	auto &handler = *(GlueHttpResponseHandler *)userdata;
	const size_t length = size * nmemb;
	handler.body.append(ptr, length);
	return length;
}

GlueHttpClient::GlueHttpClient(const char *_tls_ca)
	:tls_ca(_tls_ca)
{
	CurlInit();
}

inline CurlEasy
GlueHttpClient::PrepareRequest(const GlueHttpRequest &request,
			       CurlSlist &header_list)
{
	CurlEasy easy{request.uri.c_str()};

	if (tls_ca != nullptr)
		easy.SetCAInfo(tls_ca);

	easy.SetVerbose(verbose);
	easy.SetNoProgress();
	easy.SetNoSignal();

	if (request.connect_timeout.count() > 0)
		easy.SetConnectTimeout(request.connect_timeout);

	const auto stall_timeout = std::max(request.read_timeout,
					    request.write_timeout);
	if (stall_timeout.count() > 0)
		easy.SetStallTimeout(std::chrono::ceil<std::chrono::seconds>(stall_timeout));

	switch (request.method) {
	case HttpMethod::HEAD:
		easy.SetNoBody();
		break;

	case HttpMethod::GET:
		break;

	case HttpMethod::POST:
		easy.SetPost();
		easy.SetRequestBody(request.body.data(), request.body.size());
		header_list.Append("Content-Type: application/jose+json");
		break;
	}

	easy.SetRequestHeaders(header_list.Get());

	return easy;
}

GlueHttpResponse
GlueHttpClient::Request(const GlueHttpRequest &request)
{
	CurlSlist header_list;
	GlueHttpResponseHandler handler;

	auto easy = PrepareRequest(request, header_list);
	easy.SetHeaderFunction(GlueHttpResponseHandler::HeaderFunction, &handler);
	easy.SetWriteFunction(GlueHttpResponseHandler::WriteFunction, &handler);

	char error_buffer[CURL_ERROR_SIZE];
	error_buffer[0] = 0;
	easy.SetErrorBuffer(error_buffer);

	const CURLcode result = easy.Perform();
	if (result != CURLE_OK)
		throw HttpTransportError(fmt::format("CURL error on {}: {}",
						     request.uri,
						     *error_buffer != 0
						     ? error_buffer
						     : curl_easy_strerror(result)));

	const long code = easy.GetResponseCode();
	const auto status = static_cast<HttpStatus>(code);
	if (code < 0 || !http_status_is_valid(status))
		throw HttpTransportError(fmt::format("Invalid HTTP status {} from {}",
						     code, request.uri));

	return handler.MoveResponse(status);
}
