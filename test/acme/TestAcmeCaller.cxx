// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "acme/AcmeCaller.hxx"
#include "acme/AcmeError.hxx"
#include "acmecore/Error.hxx"

#include <gtest/gtest.h>

#include <deque>
#include <vector>

namespace {

/**
 * An #HttpClient which returns prepared responses.  A response with
 * a zero status simulates a transport error.
 */
class ScriptedHttpClient final : public HttpClient {
	std::deque<GlueHttpResponse> responses;

public:
	std::vector<GlueHttpRequest> requests;

	void Add(unsigned status, std::string body={},
		 const char *content_type=nullptr) {
		GlueHttpResponse response{static_cast<HttpStatus>(status), {},
					  std::move(body)};
		if (content_type != nullptr)
			response.headers.emplace("content-type", content_type);
		responses.emplace_back(std::move(response));
	}

	std::size_t GetRemaining() const noexcept {
		return responses.size();
	}

	GlueHttpResponse Request(const GlueHttpRequest &request) override {
		requests.push_back(request);

		if (responses.empty())
			throw std::runtime_error("No more responses");

		auto response = std::move(responses.front());
		responses.pop_front();

		if (response.status == HttpStatus{})
			throw HttpTransportError("Connection refused");

		return response;
	}
};

}

static constexpr const char *url = "https://acme.example.com/foo";

/**
 * Build a request and count how often the builder is invoked.
 */
static auto
MakeCountingBuilder(unsigned &n)
{
	return [&n](){
		++n;
		return GlueHttpRequest{
			HttpMethod::POST, url,
			"request " + std::to_string(n),
		};
	};
}

TEST(AcmeCaller, Success)
{
	ScriptedHttpClient client;
	client.Add(200, "ok");

	AcmeCaller caller(client);
	unsigned n = 0;
	const auto response = caller.Execute(MakeCountingBuilder(n));

	EXPECT_EQ(response.status, HttpStatus::OK);
	EXPECT_EQ(response.body, "ok");
	EXPECT_EQ(n, 1u);
	ASSERT_EQ(client.requests.size(), 1u);

	const auto &request = client.requests.front();
	EXPECT_EQ(request.uri, url);
	EXPECT_EQ(request.connect_timeout, AcmeCaller::TIMEOUT);
	EXPECT_EQ(request.read_timeout, AcmeCaller::TIMEOUT);
	EXPECT_EQ(request.write_timeout, AcmeCaller::TIMEOUT);
}

TEST(AcmeCaller, Created)
{
	ScriptedHttpClient client;
	client.Add(201);

	AcmeCaller caller(client);
	EXPECT_EQ(caller.Execute(HttpMethod::GET, url).status,
		  HttpStatus::CREATED);
}

/**
 * Each attempt builds a new request.
 */
TEST(AcmeCaller, RetryRebuilds)
{
	ScriptedHttpClient client;
	client.Add(500);
	client.Add(503);
	client.Add(200);

	AcmeCaller caller(client);
	unsigned n = 0;
	caller.Execute(MakeCountingBuilder(n));

	EXPECT_EQ(n, 3u);
	ASSERT_EQ(client.requests.size(), 3u);
	EXPECT_EQ(client.requests[0].body, "request 1");
	EXPECT_EQ(client.requests[1].body, "request 2");
	EXPECT_EQ(client.requests[2].body, "request 3");
}

TEST(AcmeCaller, Exhausted)
{
	ScriptedHttpClient client;
	client.Add(500, "a");
	client.Add(429, "b");
	client.Add(502, "c");
	client.Add(200);

	AcmeCaller caller(client);
	unsigned n = 0;

	try {
		caller.Execute(MakeCountingBuilder(n));
		FAIL();
	} catch (const AcmeError &e) {
		EXPECT_EQ(e.GetKind(), AcmeErrorKind::NETWORK);
		EXPECT_EQ(e.GetStatus(), 502u);
		EXPECT_EQ(e.GetBody(), "c");
	}

	EXPECT_EQ(n, AcmeCaller::MAX_ATTEMPTS);
	EXPECT_EQ(client.GetRemaining(), 1u);
}

TEST(AcmeCaller, BadRequest)
{
	ScriptedHttpClient client;
	client.Add(400,
		   R"({"type":"urn:ietf:params:acme:error:badNonce","detail":"JWS has an invalid anti-replay nonce"})",
		   "application/problem+json");
	client.Add(200);

	AcmeCaller caller(client);
	unsigned n = 0;

	try {
		caller.Execute(MakeCountingBuilder(n));
		FAIL();
	} catch (const AcmeError &e) {
		EXPECT_EQ(e.GetKind(), AcmeErrorKind::TERMINAL_CALL);
		EXPECT_EQ(e.GetStatus(), 400u);
		EXPECT_EQ(e.GetProblemType(), "urn:ietf:params:acme:error:badNonce");
		EXPECT_NE(std::string_view{e.what()}.find("invalid anti-replay nonce"),
			  std::string_view::npos);
		EXPECT_TRUE(IsAcmeBadNonceError(std::current_exception()));
		EXPECT_FALSE(IsAcmeErrorType(std::current_exception(),
					     "urn:ietf:params:acme:error:malformed"));
	}

	EXPECT_EQ(n, 1u);
	EXPECT_EQ(client.GetRemaining(), 1u);
}

/**
 * A non-2xx status which is neither 400 nor a server error is still
 * retried.
 */
TEST(AcmeCaller, RetryClientError)
{
	ScriptedHttpClient client;
	client.Add(404);
	client.Add(200);

	AcmeCaller caller(client);
	EXPECT_EQ(caller.Execute(HttpMethod::GET, url).status, HttpStatus::OK);
	EXPECT_EQ(client.requests.size(), 2u);
}

TEST(AcmeCaller, TransportError)
{
	ScriptedHttpClient client;
	client.Add(0);
	client.Add(0);
	client.Add(200);

	AcmeCaller caller(client);
	EXPECT_EQ(caller.Execute(HttpMethod::HEAD, url).status, HttpStatus::OK);
	EXPECT_EQ(client.requests.size(), 3u);
}

TEST(AcmeCaller, TransportErrorExhausted)
{
	ScriptedHttpClient client;
	client.Add(0);
	client.Add(0);
	client.Add(0);

	AcmeCaller caller(client);

	try {
		caller.Execute(HttpMethod::GET, url);
		FAIL();
	} catch (const AcmeError &e) {
		EXPECT_EQ(e.GetKind(), AcmeErrorKind::NETWORK);
		EXPECT_EQ(e.GetStatus(), 0u);
		EXPECT_TRUE(e.GetBody().empty());
	}

	EXPECT_EQ(client.requests.size(), 3u);
}

/**
 * Exceptions thrown while building the request are not retried.
 */
TEST(AcmeCaller, BuilderError)
{
	ScriptedHttpClient client;
	client.Add(200);

	AcmeCaller caller(client);
	unsigned n = 0;

	EXPECT_THROW(caller.Execute([&n]() -> GlueHttpRequest {
		++n;
		throw std::runtime_error("No nonce");
	}), std::runtime_error);

	EXPECT_EQ(n, 1u);
	EXPECT_TRUE(client.requests.empty());
}
