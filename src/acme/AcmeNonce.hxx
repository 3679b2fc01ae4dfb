// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

class AcmeCaller;
struct AcmeDirectory;

/**
 * Ask the server for a new replay nonce.  Each nonce may be used in
 * only one request.
 *
 * Throws AcmeError (kind MISSING_FIELD if the response has no
 * "Replay-Nonce" header).
 */
std::string
RequestAcmeNonce(AcmeCaller &caller, const AcmeDirectory &directory);
