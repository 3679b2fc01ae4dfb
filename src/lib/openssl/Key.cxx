// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Key.hxx"
#include "Error.hxx"
#include "UniqueBIO.hxx"

#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>

#if OPENSSL_VERSION_NUMBER >= 0x30000000L
#include <openssl/core_names.h>
#endif

#include <string.h>

UniqueEVP_PKEY
GenerateEcKey()
{
	const UniqueEVP_PKEY_CTX ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
	if (!ctx)
		throw SslError("EVP_PKEY_CTX_new_id() failed");

	if (EVP_PKEY_keygen_init(ctx.get()) <= 0)
		throw SslError("EVP_PKEY_keygen_init() failed");

	if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(),
						   NID_X9_62_prime256v1) <= 0)
		throw SslError("EVP_PKEY_CTX_set_ec_paramgen_curve_nid() failed");

	EVP_PKEY *pkey = nullptr;
	if (EVP_PKEY_keygen(ctx.get(), &pkey) <= 0)
		throw SslError("EVP_PKEY_keygen() failed");

	return UniqueEVP_PKEY(pkey);
}

UniqueEVP_PKEY
DecodePemPrivateKey(std::string_view pem)
{
	UniqueBIO in(BIO_new_mem_buf(pem.data(), int(pem.size())));
	if (!in)
		throw SslError("BIO_new_mem_buf() failed");

	UniqueEVP_PKEY key(PEM_read_bio_PrivateKey(in.get(), nullptr,
						   nullptr, nullptr));
	if (!key)
		throw SslError("Failed to parse PEM private key");

	return key;
}

std::string
EncodePemPrivateKey(EVP_PKEY &key)
{
	UniqueBIO out(BIO_new(BIO_s_mem()));
	if (!out)
		throw SslError("BIO_new() failed");

	if (!PEM_write_bio_PrivateKey(out.get(), &key, nullptr,
				      nullptr, 0, nullptr, nullptr))
		throw SslError("PEM_write_bio_PrivateKey() failed");

	char *data;
	const long length = BIO_get_mem_data(out.get(), &data);
	return {data, std::size_t(length)};
}

bool
IsP256Key(EVP_PKEY &key) noexcept
{
	if (EVP_PKEY_base_id(&key) != EVP_PKEY_EC)
		return false;

#if OPENSSL_VERSION_NUMBER >= 0x30000000L
	char name[64];
	size_t length;
	if (!EVP_PKEY_get_utf8_string_param(&key, OSSL_PKEY_PARAM_GROUP_NAME,
					    name, sizeof(name), &length))
		return false;

	return strcmp(name, SN_X9_62_prime256v1) == 0;
#else
	const EC_KEY *ec_key = EVP_PKEY_get0_EC_KEY(&key);
	return ec_key != nullptr &&
		EC_GROUP_get_curve_name(EC_KEY_get0_group(ec_key)) == NID_X9_62_prime256v1;
#endif
}
