// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AcmeClient.hxx"
#include "AcmeError.hxx"
#include "AcmeJson.hxx"
#include "AcmeNonce.hxx"
#include "JWS.hxx"
#include "acmecore/Persist.hxx"

#include <nlohmann/json.hpp>

using std::string_view_literals::operator""sv;
using json = nlohmann::json;

AcmeClient::AcmeClient(HttpClient &http_client, AcmePersist &_persist,
		       const char *directory_url)
	:caller(http_client), persist(_persist),
	 directory(std::make_shared<const AcmeDirectory>(FetchAcmeDirectory(caller,
									    directory_url)))
{
}

std::string
AcmeClient::NewNonce()
{
	return RequestAcmeNonce(caller, *directory);
}

GlueHttpResponse
AcmeClient::SignedRequest(const AcmeKey &key, const char *url,
			  std::string_view payload)
{
	return caller.Execute([this, &key, url, payload](){
		const auto nonce = NewNonce();
		const json envelope = SignAcmeRequest(key, url, nonce, payload);
		logger(4, "Call ", url);
		return GlueHttpRequest{HttpMethod::POST, url, envelope.dump()};
	});
}

GlueHttpResponse
AcmeClient::SignedRequest(const AcmeKey &key, const char *url,
			  const json &payload)
{
	const auto s = payload.dump();
	return SignedRequest(key, url, std::string_view{s});
}

/**
 * Wrap exceptions thrown by the #AcmePersist implementation which
 * are not an #AcmeError already.
 */
template<typename F>
static auto
WithPersistError(const char *msg, F &&f)
{
	try {
		return f();
	} catch (const AcmeError &) {
		throw;
	} catch (...) {
		std::throw_with_nested(AcmeError(AcmeErrorKind::PERSISTENCE, msg));
	}
}

AcmeKey
AcmeClient::LoadOrGenerateKey(const AcmePersistKey &persist_key, bool &is_new)
{
	const auto pem = WithPersistError("Failed to load account key", [&](){
		return persist.Get(persist_key);
	});

	if (pem) {
		logger(4, "Read persisted ACME account key");
		is_new = false;
		return AcmeKey::FromPem(*pem);
	} else {
		logger(4, "Create new ACME account key");
		is_new = true;
		return AcmeKey::Generate();
	}
}

void
AcmeClient::StoreKey(const AcmePersistKey &persist_key, const AcmeKey &key)
{
	logger(4, "Persist ACME account key");

	const auto pem = key.ToPem();
	WithPersistError("Failed to store account key", [&](){
		persist.Put(persist_key, pem);
	});
}

static AcmeAccount
ParseAccount(const GlueHttpResponse &response)
{
	try {
		return json::parse(response.body).get<AcmeAccount>();
	} catch (...) {
		std::throw_with_nested(MakeDecodeError("Malformed ACME account"));
	}
}

AcmeAccountIdentity
AcmeClient::GetAccount(const char *email)
{
	const AcmePersistKey persist_key{
		"acme_account",
		email,
		AcmePersistKind::ACCOUNT_PRIVATE_KEY,
	};

	bool is_new;
	auto key = LoadOrGenerateKey(persist_key, is_new);

	/* this is fine for both new and existing keys; for an
	   existing key, the server responds with the existing
	   account and its URL in the "Location" header */
	const auto payload = MakeNewAccountRequest(email).dump();
	auto response = SignedRequest(key, directory->new_account.c_str(),
				      std::string_view{payload});

	const char *location = response.FindHeader("location"sv);
	if (location == nullptr || *location == 0)
		throw MakeMissingFieldError("location");

	logger(4, "Key id is: ", location);

	/* decode before persisting, so a malformed response never
	   leaves an unregistered key behind */
	auto account = ParseAccount(response);
	account.location = location;

	key.SetKeyId(location);

	if (is_new)
		StoreKey(persist_key, key);

	return {directory, email, std::move(key), std::move(account)};
}
