// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Base64.hxx"
#include "Init.hxx"
#include "acme/AcmeError.hxx"

#include <sodium/utils.h>

#include <string.h>

static constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;

std::string
UrlSafeBase64(std::span<const std::byte> src)
{
	SodiumInit();

	const std::size_t size = sodium_base64_ENCODED_LEN(src.size(), variant);
	std::string result;
	result.resize(size);

	sodium_bin2base64(result.data(), size,
			  reinterpret_cast<const unsigned char *>(src.data()),
			  src.size(), variant);

	/* strip the null terminator */
	result.resize(strlen(result.c_str()));
	return result;
}

std::string
UrlSafeBase64(std::string_view src)
{
	return UrlSafeBase64(std::as_bytes(std::span{src}));
}

std::vector<std::byte>
DecodeUrlSafeBase64(std::string_view src)
{
	SodiumInit();

	std::vector<std::byte> result(src.size() * 3 / 4 + 1);
	std::size_t length;

	if (sodium_base642bin(reinterpret_cast<unsigned char *>(result.data()),
			      result.size(),
			      src.data(), src.size(),
			      nullptr, &length, nullptr, variant) != 0)
		throw MakeDecodeError("Malformed base64url string");

	result.resize(length);
	return result;
}
