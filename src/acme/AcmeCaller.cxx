// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AcmeCaller.hxx"
#include "AcmeError.hxx"

inline void
AcmeCaller::Configure(GlueHttpRequest &request) noexcept
{
	request.connect_timeout = TIMEOUT;
	request.read_timeout = TIMEOUT;
	request.write_timeout = TIMEOUT;
}

GlueHttpResponse
AcmeCaller::Execute(const std::function<GlueHttpRequest()> &make_request)
{
	for (unsigned attempt = 1;; ++attempt) {
		auto request = make_request();
		Configure(request);

		logger.Fmt(5, "{} {} (attempt {}/{})",
			   http_method_to_string(request.method), request.uri,
			   attempt, MAX_ATTEMPTS);

		GlueHttpResponse response;

		try {
			response = client.Request(request);
		} catch (const HttpTransportError &) {
			if (attempt >= MAX_ATTEMPTS) {
				logger(5, "No more retries");
				std::throw_with_nested(AcmeError(AcmeErrorKind::NETWORK,
								 "Call failed",
								 0, {}));
			}

			logger(4, "Retrying after transport error: ",
			       std::current_exception());
			continue;
		}

		logger.Fmt(5, "Status: {}", unsigned(response.status));

		if (http_status_is_success(response.status))
			return response;

		if (response.status == HttpStatus::BAD_REQUEST)
			throw MakeCallError(AcmeErrorKind::TERMINAL_CALL,
					    std::move(response));

		if (attempt >= MAX_ATTEMPTS) {
			logger(5, "No more retries");
			throw MakeCallError(AcmeErrorKind::NETWORK,
					    std::move(response));
		}

		logger.Fmt(4, "Retrying after status {}", unsigned(response.status));
	}
}

GlueHttpResponse
AcmeCaller::Execute(HttpMethod method, const char *uri)
{
	return Execute([method, uri](){
		return GlueHttpRequest{method, uri, {}};
	});
}
