// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AcmeKey.hxx"
#include "AcmeError.hxx"
#include "lib/openssl/Key.hxx"
#include "lib/openssl/Error.hxx"

#include <stdexcept>

AcmeKey
AcmeKey::Generate()
{
	return AcmeKey{GenerateEcKey()};
}

AcmeKey
AcmeKey::FromPem(std::string_view pem)
{
	UniqueEVP_PKEY key;

	try {
		key = DecodePemPrivateKey(pem);
	} catch (const SslError &) {
		std::throw_with_nested(MakeDecodeError("Failed to read PEM"));
	}

	if (!IsP256Key(*key))
		throw MakeDecodeError("Not a P-256 key");

	return AcmeKey{std::move(key)};
}

std::string
AcmeKey::ToPem() const
{
	return EncodePemPrivateKey(*key);
}

void
AcmeKey::SetKeyId(std::string_view id)
{
	if (id.empty())
		throw std::invalid_argument("Empty key id");

	if (!key_id.empty() && key_id != id)
		throw std::logic_error("Key id already set");

	key_id = id;
}
