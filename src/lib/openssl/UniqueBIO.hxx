// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <openssl/bio.h>

#include <memory>

namespace OpenSSL {

struct BIODeleter {
	void operator()(BIO *bio) noexcept {
		BIO_free(bio);
	}
};

} // namespace OpenSSL

using UniqueBIO = std::unique_ptr<BIO, OpenSSL::BIODeleter>;
