// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeAcmeServer.hxx"
#include "acme/JWS.hxx"
#include "lib/sodium/Base64.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;
using json = nlohmann::json;

namespace {

/**
 * Thrown by FakeAcmeServer::Verify() to reject a request.
 */
struct FakeProblem {
	HttpStatus status;
	std::string type, detail;
};

}

static GlueHttpResponse
MakeJsonResponse(HttpStatus status, const json &body)
{
	GlueHttpResponse response{status, {}, body.dump()};
	response.headers.emplace("content-type", "application/json");
	return response;
}

static GlueHttpResponse
MakeProblemResponse(const FakeProblem &problem)
{
	const json body{
		{"type", problem.type},
		{"detail", problem.detail},
	};

	GlueHttpResponse response{problem.status, {}, body.dump()};
	response.headers.emplace("content-type", "application/problem+json");
	return response;
}

static std::string
DecodeToString(std::string_view src)
{
	const auto v = DecodeUrlSafeBase64(src);
	return {reinterpret_cast<const char *>(v.data()), v.size()};
}

std::string
FakeAcmeServer::NextNonce()
{
	auto nonce = fmt::format("nonce-{}", ++nonce_counter);
	issued_nonces.emplace(nonce);
	return nonce;
}

void
FakeAcmeServer::AddNonce(GlueHttpResponse &response)
{
	if (!omit_nonce)
		response.headers.emplace("replay-nonce", NextNonce());
}

GlueHttpResponse
FakeAcmeServer::Request(const GlueHttpRequest &request)
{
	requests.push_back(request);

	if (request.uri == DIRECTORY_URL && request.method == HttpMethod::GET)
		return HandleDirectory();

	if (request.uri == NEW_NONCE_URL && request.method == HttpMethod::HEAD)
		return HandleNewNonce();

	if (request.uri == NEW_ACCOUNT_URL && request.method == HttpMethod::POST)
		return HandleNewAccount(request);

	if (request.uri.starts_with(ACCOUNT_URL_PREFIX) &&
	    request.uri.ends_with("/orders"sv) &&
	    request.method == HttpMethod::POST)
		return HandleAccountOrders(request);

	return {HttpStatus::NOT_FOUND, {}, "Not found"};
}

GlueHttpResponse
FakeAcmeServer::HandleDirectory()
{
	if (malformed_directory)
		return MakeJsonResponse(HttpStatus::OK, json{
				{"newNonce", NEW_NONCE_URL},
				{"newAccount", 42},
			});

	return MakeJsonResponse(HttpStatus::OK, json{
			{"newNonce", NEW_NONCE_URL},
			{"newAccount", NEW_ACCOUNT_URL},
			{"newOrder", NEW_ORDER_URL},
			{"revokeCert", "https://acme.example.com/acme/revoke-cert"},
			{"keyChange", "https://acme.example.com/acme/key-change"},
			{"renewalInfo", "https://acme.example.com/acme/renewal-info"},
			{"meta", {
					{"termsOfService", "https://acme.example.com/terms.pdf"},
				}},
		});
}

GlueHttpResponse
FakeAcmeServer::HandleNewNonce()
{
	GlueHttpResponse response{HttpStatus::OK, {}, {}};
	response.headers.emplace("cache-control", "no-store");
	AddNonce(response);
	return response;
}

std::pair<json, std::string>
FakeAcmeServer::Verify(const GlueHttpRequest &request)
{
	const auto envelope = json::parse(request.body);
	auto header = json::parse(DecodeToString(envelope.at("protected").get<std::string>()));
	auto payload = DecodeToString(envelope.at("payload").get<std::string>());

	protected_headers.push_back(header);

	const auto nonce = header.at("nonce").get<std::string>();
	if (!issued_nonces.contains(nonce) ||
	    !used_nonces.emplace(nonce).second)
		throw FakeProblem{
			HttpStatus::BAD_REQUEST,
			"urn:ietf:params:acme:error:badNonce",
			fmt::format("Invalid nonce '{}'", nonce),
		};

	if (header.at("url") != request.uri)
		throw FakeProblem{
			HttpStatus::UNAUTHORIZED,
			"urn:ietf:params:acme:error:unauthorized",
			"URL mismatch",
		};

	if (header.contains("jwk") == header.contains("kid"))
		throw FakeProblem{
			HttpStatus::BAD_REQUEST,
			"urn:ietf:params:acme:error:malformed",
			"Need exactly one of jwk and kid",
		};

	return {std::move(header), std::move(payload)};
}

GlueHttpResponse
FakeAcmeServer::HandleNewAccount(const GlueHttpRequest &request)
try {
	++new_account_requests;

	auto [header, payload] = Verify(request);

	if (!new_account_failures.empty()) {
		auto failure = std::move(new_account_failures.front());
		new_account_failures.pop_front();

		if (failure.status == 0)
			throw HttpTransportError("Connection reset by peer");

		return {static_cast<HttpStatus>(failure.status), {},
			std::move(failure.body)};
	}

	if (!header.contains("jwk"))
		throw FakeProblem{
			HttpStatus::BAD_REQUEST,
			"urn:ietf:params:acme:error:malformed",
			"newAccount requires jwk",
		};

	const auto thumbprint = MakeJwkThumbprint(header.at("jwk"));

	HttpStatus status = HttpStatus::OK;
	auto i = accounts.find(thumbprint);
	if (i == accounts.end()) {
		status = HttpStatus::CREATED;
		i = accounts.emplace(thumbprint,
				     fmt::format("{}{}", ACCOUNT_URL_PREFIX,
						 accounts.size() + 1)).first;
	}

	const auto &location = i->second;
	const auto request_body = json::parse(payload);

	auto response = MakeJsonResponse(status, json{
			{"status", "valid"},
			{"contact", request_body.at("contact")},
			{"orders", location + "/orders"},
		});

	if (!account_body.empty())
		response.body = account_body;

	if (!omit_location)
		response.headers.emplace("location", location);

	AddNonce(response);
	return response;
} catch (const FakeProblem &problem) {
	return MakeProblemResponse(problem);
}

GlueHttpResponse
FakeAcmeServer::HandleAccountOrders(const GlueHttpRequest &request)
try {
	auto [header, payload] = Verify(request);

	if (!header.contains("kid"))
		throw FakeProblem{
			HttpStatus::BAD_REQUEST,
			"urn:ietf:params:acme:error:malformed",
			"kid required",
		};

	const auto kid = header.at("kid").get<std::string>();
	if (!request.uri.starts_with(kid))
		throw FakeProblem{
			HttpStatus::FORBIDDEN,
			"urn:ietf:params:acme:error:unauthorized",
			"Not your account",
		};

	if (!payload.empty())
		throw FakeProblem{
			HttpStatus::BAD_REQUEST,
			"urn:ietf:params:acme:error:malformed",
			"POST-as-GET expected",
		};

	auto response = MakeJsonResponse(HttpStatus::OK, json{
			{"orders", json::array()},
		});
	AddNonce(response);
	return response;
} catch (const FakeProblem &problem) {
	return MakeProblemResponse(problem);
}
