// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * Encode the given buffer with the URL-safe base64 alphabet without
 * padding (RFC 4648 section 5, as used by JOSE).
 */
std::string
UrlSafeBase64(std::span<const std::byte> src);

std::string
UrlSafeBase64(std::string_view src);

/**
 * Decode a URL-safe base64 string without padding.
 *
 * Throws AcmeError (kind DECODE) if the input is malformed.
 */
std::vector<std::byte>
DecodeUrlSafeBase64(std::string_view src);
