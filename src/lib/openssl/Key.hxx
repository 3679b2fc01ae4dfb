// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UniqueEVP.hxx"

#include <string>
#include <string_view>

/**
 * Generate a new private key on the NIST P-256 curve
 * ("prime256v1").
 *
 * Throws SslError on error.
 */
UniqueEVP_PKEY
GenerateEcKey();

/**
 * Parse a PEM-encoded private key (PKCS#8 or the traditional
 * format).
 *
 * Throws SslError on error.
 */
UniqueEVP_PKEY
DecodePemPrivateKey(std::string_view pem);

/**
 * Serialize the private key as PKCS#8 PEM.
 *
 * Throws SslError on error.
 */
std::string
EncodePemPrivateKey(EVP_PKEY &key);

/**
 * Is this an EC key on the NIST P-256 curve?
 */
[[gnu::pure]]
bool
IsP256Key(EVP_PKEY &key) noexcept;
