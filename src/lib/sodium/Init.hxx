// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Initialize libsodium.  Only the first call does anything; later
 * calls are cheap and thread-safe.
 *
 * Throws on error.
 */
void
SodiumInit();
