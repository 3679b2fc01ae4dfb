// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <openssl/bn.h>
#include <openssl/ecdsa.h>

#include <memory>

namespace OpenSSL {

struct ECDSA_SIG_Deleter {
	void operator()(ECDSA_SIG *sig) noexcept {
		ECDSA_SIG_free(sig);
	}
};

struct BIGNUM_Deleter {
	void operator()(BIGNUM *bn) noexcept {
		BN_clear_free(bn);
	}
};

} // namespace OpenSSL

using UniqueECDSA_SIG = std::unique_ptr<ECDSA_SIG, OpenSSL::ECDSA_SIG_Deleter>;
using UniqueBIGNUM = std::unique_ptr<BIGNUM, OpenSSL::BIGNUM_Deleter>;
