// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "JWS.hxx"
#include "AcmeKey.hxx"
#include "lib/openssl/Error.hxx"
#include "lib/openssl/Key.hxx"
#include "lib/openssl/UniqueECDSA.hxx"
#include "lib/openssl/UniqueEVP.hxx"
#include "lib/sodium/Base64.hxx"

#include <openssl/ec.h>
#include <openssl/evp.h>

#if OPENSSL_VERSION_NUMBER >= 0x30000000L
#include <openssl/core_names.h>
#endif

#include <nlohmann/json.hpp>
using json = nlohmann::json;

#include <array>
#include <stdexcept>
#include <vector>

using std::string_view_literals::operator""sv;

/**
 * The size of one P-256 coordinate or signature component.
 */
static constexpr std::size_t P256_SIZE = 32;

static std::string
BignumToBase64(const BIGNUM &bn)
{
	std::array<std::byte, P256_SIZE> buffer;
	if (BN_bn2binpad(&bn, reinterpret_cast<unsigned char *>(buffer.data()),
			 buffer.size()) < 0)
		throw SslError("BN_bn2binpad() failed");

	return UrlSafeBase64(buffer);
}

json
MakeJwk(EVP_PKEY &key)
{
	if (!IsP256Key(key))
		throw std::runtime_error("P-256 key expected");

#if OPENSSL_VERSION_NUMBER >= 0x30000000L
	BIGNUM *x_ = nullptr;
	if (!EVP_PKEY_get_bn_param(&key, OSSL_PKEY_PARAM_EC_PUB_X, &x_))
		throw SslError("Failed to get EC X value");

	const UniqueBIGNUM x(x_);

	BIGNUM *y_ = nullptr;
	if (!EVP_PKEY_get_bn_param(&key, OSSL_PKEY_PARAM_EC_PUB_Y, &y_))
		throw SslError("Failed to get EC Y value");

	const UniqueBIGNUM y(y_);
#else
	const EC_KEY *ec_key = EVP_PKEY_get0_EC_KEY(&key);
	const UniqueBIGNUM x(BN_new()), y(BN_new());
	if (!x || !y)
		throw SslError("BN_new() failed");

	if (!EC_POINT_get_affine_coordinates(EC_KEY_get0_group(ec_key),
					     EC_KEY_get0_public_key(ec_key),
					     x.get(), y.get(), nullptr))
		throw SslError("Failed to get EC coordinates");
#endif

	return {
		{ "crv"sv, "P-256"sv },
		{ "kty"sv, "EC"sv },
		{ "x"sv, BignumToBase64(*x) },
		{ "y"sv, BignumToBase64(*y) },
	};
}

std::string
MakeJwkThumbprint(const json &jwk)
{
	/* nlohmann::json sorts object members and emits no
	   whitespace, which is the canonical form required by RFC
	   7638 */
	const auto canonical = jwk.dump();

	std::array<std::byte, EVP_MAX_MD_SIZE> md;
	unsigned md_length;
	if (!EVP_Digest(canonical.data(), canonical.size(),
			reinterpret_cast<unsigned char *>(md.data()), &md_length,
			EVP_sha256(), nullptr))
		throw SslError("EVP_Digest() failed");

	return UrlSafeBase64(std::span{md}.first(md_length));
}

std::string
SignES256(EVP_PKEY &key, std::string_view protected_b64,
	  std::string_view payload_b64)
{
	const UniqueEVP_MD_CTX ctx(EVP_MD_CTX_new());
	if (!ctx)
		throw SslError("EVP_MD_CTX_new() failed");

	if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(),
			       nullptr, &key) <= 0)
		throw SslError("EVP_DigestSignInit() failed");

	if (EVP_DigestSignUpdate(ctx.get(), protected_b64.data(),
				 protected_b64.size()) <= 0 ||
	    EVP_DigestSignUpdate(ctx.get(), ".", 1) <= 0 ||
	    EVP_DigestSignUpdate(ctx.get(), payload_b64.data(),
				 payload_b64.size()) <= 0)
		throw SslError("EVP_DigestSignUpdate() failed");

	size_t length;
	if (EVP_DigestSignFinal(ctx.get(), nullptr, &length) <= 0)
		throw SslError("EVP_DigestSignFinal() failed");

	std::vector<unsigned char> der(length);
	if (EVP_DigestSignFinal(ctx.get(), der.data(), &length) <= 0)
		throw SslError("EVP_DigestSignFinal() failed");

	/* convert the DER-encoded ECDSA-Sig-Value to R||S */
	const unsigned char *p = der.data();
	const UniqueECDSA_SIG sig(d2i_ECDSA_SIG(nullptr, &p, long(length)));
	if (!sig)
		throw SslError("d2i_ECDSA_SIG() failed");

	const BIGNUM *r, *s;
	ECDSA_SIG_get0(sig.get(), &r, &s);

	std::array<unsigned char, P256_SIZE * 2> raw;
	if (BN_bn2binpad(r, raw.data(), P256_SIZE) < 0 ||
	    BN_bn2binpad(s, raw.data() + P256_SIZE, P256_SIZE) < 0)
		throw SslError("BN_bn2binpad() failed");

	return UrlSafeBase64(std::as_bytes(std::span{raw}));
}

static json
MakeHeader(const AcmeKey &key, std::string_view url, std::string_view nonce)
{
	json root{
		{"alg", "ES256"},
		{"url", url},
		{"nonce", nonce},
	};
	if (key.HasKeyId())
		root.emplace("kid", key.GetKeyId());
	else
		root.emplace("jwk", MakeJwk(*key));
	return root;
}

AcmeSignedEnvelope
SignAcmeRequest(const AcmeKey &key, std::string_view url,
		std::string_view nonce, std::string_view payload)
{
	AcmeSignedEnvelope envelope;
	envelope.protected_header = UrlSafeBase64(MakeHeader(key, url, nonce).dump());
	envelope.payload = UrlSafeBase64(payload);
	envelope.signature = SignES256(*key, envelope.protected_header,
				       envelope.payload);
	return envelope;
}

void
to_json(json &jv, const AcmeSignedEnvelope &envelope)
{
	jv = {
		{"protected", envelope.protected_header},
		{"payload", envelope.payload},
		{"signature", envelope.signature},
	};
}
