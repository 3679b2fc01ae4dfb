// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "lib/openssl/UniqueEVP.hxx"

#include <string>
#include <string_view>

/**
 * An ACME account key: a private key on the NIST P-256 curve and,
 * once the server has confirmed the registration, the key id
 * (i.e. the account URL).
 */
class AcmeKey {
	UniqueEVP_PKEY key;

	/**
	 * Empty until SetKeyId() has been called.
	 */
	std::string key_id;

public:
	explicit AcmeKey(UniqueEVP_PKEY &&_key) noexcept
		:key(std::move(_key)) {}

	AcmeKey(AcmeKey &&) = default;
	AcmeKey &operator=(AcmeKey &&) = default;

	/**
	 * Generate a new key.
	 */
	static AcmeKey Generate();

	/**
	 * Load a PEM-encoded private key.  The key id is never
	 * stored; it needs to be obtained from the server again.
	 *
	 * Throws AcmeError (kind DECODE) if the PEM is malformed or
	 * the key is not a P-256 key.
	 */
	static AcmeKey FromPem(std::string_view pem);

	/**
	 * Serialize the private key (without the key id) as PEM.
	 */
	std::string ToPem() const;

	auto &operator*() const noexcept {
		return *key;
	}

	bool HasKeyId() const noexcept {
		return !key_id.empty();
	}

	const std::string &GetKeyId() const noexcept {
		return key_id;
	}

	/**
	 * Assign the key id after a successful registration.  The
	 * key id can be set only once; setting the same value again
	 * is allowed, but a different value throws
	 * std::logic_error.
	 */
	void SetKeyId(std::string_view id);
};
