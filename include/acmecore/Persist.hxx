// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * The storage interface used by the ACME client to keep account keys
 * across sessions.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class AcmePersistKind : uint8_t {
	ACCOUNT_PRIVATE_KEY,
	PRIVATE_KEY,
	CERTIFICATE,
};

constexpr const char *
AcmePersistKindToString(AcmePersistKind kind) noexcept
{
	switch (kind) {
	case AcmePersistKind::ACCOUNT_PRIVATE_KEY:
		return "acct_key";

	case AcmePersistKind::PRIVATE_KEY:
		return "key";

	case AcmePersistKind::CERTIFICATE:
		return "crt";
	}

	return "?";
}

/**
 * Addresses one value in an #AcmePersist store.
 */
struct AcmePersistKey {
	/**
	 * The category of the value, e.g. "acme_account".
	 */
	std::string realm;

	/**
	 * Distinguishes values within the realm, e.g. the contact
	 * email address.
	 */
	std::string key;

	AcmePersistKind kind;

	/**
	 * A string which identifies this key uniquely, suitable as a
	 * map key.
	 */
	std::string ToString() const {
		std::string result = realm;
		result += '_';
		result += AcmePersistKindToString(kind);
		result += '_';
		result += key;
		return result;
	}
};

/**
 * A key/value store for ACME account keys.  Implementations are
 * responsible for their own atomicity; the ACME client neither
 * iterates nor deletes entries.
 */
class AcmePersist {
public:
	virtual ~AcmePersist() noexcept = default;

	/**
	 * Look up a value.
	 *
	 * Throws AcmeError (kind PERSISTENCE) on error.
	 *
	 * @return the value or std::nullopt if no such value exists
	 */
	virtual std::optional<std::string> Get(const AcmePersistKey &key) = 0;

	/**
	 * Store a value, replacing any existing one.
	 *
	 * Throws AcmeError (kind PERSISTENCE) on error.
	 */
	virtual void Put(const AcmePersistKey &key, std::string_view value) = 0;
};
