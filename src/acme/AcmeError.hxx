// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "acmecore/Error.hxx"

#include <exception>
#include <string_view>

struct GlueHttpResponse;

/**
 * Construct an #AcmeError describing a failed call.  If the response
 * is an RFC 7807 problem document, its "detail" is added to the
 * message and its "type" is stored.
 */
AcmeError
MakeCallError(AcmeErrorKind kind, GlueHttpResponse &&response) noexcept;

AcmeError
MakeMissingFieldError(std::string_view name) noexcept;

AcmeError
MakeDecodeError(std::string_view msg) noexcept;

/**
 * Does the exception (or one of its nested exceptions) carry an
 * ACME problem document of the given type?
 */
[[gnu::pure]]
bool
IsAcmeErrorType(std::exception_ptr ep, std::string_view type) noexcept;

[[gnu::pure]]
bool
IsAcmeBadNonceError(std::exception_ptr ep) noexcept;
