// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <openssl/evp.h>

#include <memory>

namespace OpenSSL {

struct EVP_PKEY_Deleter {
	void operator()(EVP_PKEY *key) noexcept {
		EVP_PKEY_free(key);
	}
};

struct EVP_PKEY_CTX_Deleter {
	void operator()(EVP_PKEY_CTX *ctx) noexcept {
		EVP_PKEY_CTX_free(ctx);
	}
};

struct EVP_MD_CTX_Deleter {
	void operator()(EVP_MD_CTX *ctx) noexcept {
		EVP_MD_CTX_free(ctx);
	}
};

} // namespace OpenSSL

using UniqueEVP_PKEY = std::unique_ptr<EVP_PKEY, OpenSSL::EVP_PKEY_Deleter>;
using UniqueEVP_PKEY_CTX = std::unique_ptr<EVP_PKEY_CTX, OpenSSL::EVP_PKEY_CTX_Deleter>;
using UniqueEVP_MD_CTX = std::unique_ptr<EVP_MD_CTX, OpenSSL::EVP_MD_CTX_Deleter>;
