// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

class AcmeCaller;

/**
 * Well-known ACME servers.
 */
enum class AcmeServer : uint8_t {
	LETS_ENCRYPT,
	LETS_ENCRYPT_STAGING,
};

constexpr const char *
GetAcmeDirectoryUrl(AcmeServer server) noexcept
{
	switch (server) {
	case AcmeServer::LETS_ENCRYPT:
		return "https://acme-v02.api.letsencrypt.org/directory";

	case AcmeServer::LETS_ENCRYPT_STAGING:
		return "https://acme-staging-v02.api.letsencrypt.org/directory";
	}

	return nullptr;
}

/**
 * The directory object of an ACME server (RFC 8555 section 7.1.1).
 */
struct AcmeDirectory {
	std::string new_nonce;
	std::string new_account;
	std::string new_order;

	/**
	 * Optional endpoints; empty if the server does not provide
	 * them.
	 */
	std::string revoke_cert;
	std::string key_change;

	/**
	 * The "meta.termsOfService" URL; may be empty.
	 */
	std::string terms_of_service;

	/**
	 * The "meta.website" URL; may be empty.
	 */
	std::string website;

	/**
	 * The "meta.caaIdentities" list: host names the server
	 * recognizes in CAA records.
	 */
	std::vector<std::string> caa_identities;

	/**
	 * Does the server require an external account binding
	 * ("meta.externalAccountRequired")?
	 */
	bool external_account_required = false;

	/**
	 * All string members of the directory object, including
	 * those listed above and those unknown to this library.
	 */
	std::map<std::string, std::string, std::less<>> entries;

	/**
	 * Look up an arbitrary directory entry.
	 *
	 * @return the URL or nullptr if there is no such entry
	 */
	[[gnu::pure]]
	const char *Find(std::string_view name) const noexcept {
		auto i = entries.find(name);
		return i != entries.end()
			? i->second.c_str()
			: nullptr;
	}
};

/**
 * Download and parse the directory.
 *
 * Throws AcmeError (kind NETWORK or TERMINAL_CALL if the request
 * fails, kind DECODE if the response is malformed).
 */
AcmeDirectory
FetchAcmeDirectory(AcmeCaller &caller, const char *url);
