// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "AcmeCaller.hxx"
#include "AcmeAccount.hxx"
#include "AcmeDirectory.hxx"
#include "AcmeKey.hxx"

#include <nlohmann/json_fwd.hpp>

#include <memory>
#include <string>
#include <string_view>

class AcmePersist;
struct AcmePersistKey;

/**
 * A registered ACME account, ready to be used for signed requests.
 */
class AcmeAccountIdentity {
	std::shared_ptr<const AcmeDirectory> directory;

	std::string email;

	AcmeKey key;

	AcmeAccount account;

public:
	AcmeAccountIdentity(std::shared_ptr<const AcmeDirectory> _directory,
			    std::string_view _email,
			    AcmeKey &&_key, AcmeAccount &&_account) noexcept
		:directory(std::move(_directory)), email(_email),
		 key(std::move(_key)), account(std::move(_account)) {}

	const AcmeDirectory &GetDirectory() const noexcept {
		return *directory;
	}

	const std::string &GetEmail() const noexcept {
		return email;
	}

	/**
	 * The account key; its key id is always set.
	 */
	const AcmeKey &GetKey() const noexcept {
		return key;
	}

	const AcmeAccount &GetAccount() const noexcept {
		return account;
	}

	std::string GetPrivateKeyPem() const {
		return key.ToPem();
	}
};

/**
 * Implementation of an ACME client, i.e. the protocol of the "Let's
 * Encrypt" project: directory discovery, account registration and
 * signed requests.
 *
 * @see https://datatracker.ietf.org/doc/html/rfc8555
 */
class AcmeClient {
	AcmeCaller caller;

	AcmePersist &persist;

	std::shared_ptr<const AcmeDirectory> directory;

	const LLogger logger{"acme"};

public:
	/**
	 * Download the directory.
	 *
	 * Throws AcmeError on error.
	 *
	 * @param http_client the transport used for all requests; must
	 * outlive this object
	 * @param _persist the store for account keys; must outlive this
	 * object
	 */
	AcmeClient(HttpClient &http_client, AcmePersist &_persist,
		   const char *directory_url);

	AcmeClient(HttpClient &http_client, AcmePersist &_persist,
		   AcmeServer server)
		:AcmeClient(http_client, _persist, GetAcmeDirectoryUrl(server)) {}

	const AcmeDirectory &GetDirectory() const noexcept {
		return *directory;
	}

	/**
	 * Obtain a fresh replay nonce.
	 */
	std::string NewNonce();

	/**
	 * Access the account identified by a contact email address.
	 *
	 * If a persisted private key exists for this address, it is
	 * loaded and the same account is used again.  Otherwise, a new
	 * key is generated.  Either way, the "newAccount" endpoint is
	 * called, which registers a new key and returns the existing
	 * account for a known key, and the key id is taken from its
	 * response.  A new key is persisted only after the server has
	 * accepted it.
	 *
	 * Throws AcmeError on error.
	 */
	AcmeAccountIdentity GetAccount(const char *email);

	/**
	 * Send a signed POST request.  Each attempt obtains a new
	 * nonce and signs again.
	 *
	 * Throws AcmeError on error.
	 *
	 * @param payload the JSON payload; an empty string for
	 * "POST-as-GET"
	 */
	GlueHttpResponse SignedRequest(const AcmeKey &key, const char *url,
				       std::string_view payload);

	GlueHttpResponse SignedRequest(const AcmeKey &key, const char *url,
				       const nlohmann::json &payload);

	GlueHttpResponse PostAsGet(const AcmeKey &key, const char *url) {
		return SignedRequest(key, url, std::string_view{});
	}

private:
	AcmeKey LoadOrGenerateKey(const AcmePersistKey &persist_key,
				  bool &is_new);
	void StoreKey(const AcmePersistKey &persist_key,
		      const AcmeKey &key);
};
