// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Call curl_global_init() once.
 *
 * Throws on error.
 */
void
CurlInit();
