// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/* JSON Web Signature library */

#pragma once

#include <openssl/ossl_typ.h>

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <string_view>

class AcmeKey;

/**
 * A JWS in the flattened JSON serialization (RFC 7515 section
 * 7.2.2).  All members are base64url-encoded.  Each envelope carries
 * its own nonce, and must be sent only once.
 */
struct AcmeSignedEnvelope {
	std::string protected_header;
	std::string payload;
	std::string signature;
};

void
to_json(nlohmann::json &jv, const AcmeSignedEnvelope &envelope);

/**
 * Build the JSON Web Key (RFC 7517) of the public part of the given
 * P-256 key.
 *
 * Throws on error.
 */
nlohmann::json
MakeJwk(EVP_PKEY &key);

/**
 * Calculate the JWK thumbprint (RFC 7638) of a JWK, base64url
 * encoded.
 */
std::string
MakeJwkThumbprint(const nlohmann::json &jwk);

/**
 * Calculate the ES256 signature of the JWS signing input
 * "PROTECTED.PAYLOAD", encoded as the base64url of the raw R||S
 * concatenation (RFC 7518 section 3.4).
 *
 * Throws on error.
 */
std::string
SignES256(EVP_PKEY &key, std::string_view protected_b64,
	  std::string_view payload_b64);

/**
 * Sign a request to the given ACME URL.  The protected header
 * contains the public key ("jwk") if the key has no key id yet, and
 * the key id ("kid") otherwise.
 *
 * @param nonce a fresh replay nonce which must not have been used
 * before
 * @param payload the JSON payload; an empty string for
 * "POST-as-GET" requests
 */
AcmeSignedEnvelope
SignAcmeRequest(const AcmeKey &key, std::string_view url,
		std::string_view nonce, std::string_view payload);
