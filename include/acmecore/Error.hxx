// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Error type thrown by the ACME client.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

enum class AcmeErrorKind : uint8_t {
	/**
	 * A transport-level failure, or all attempts failed
	 * on transient HTTP status codes.
	 */
	NETWORK,

	/**
	 * The server rejected the request with a status which is not
	 * retried.
	 */
	TERMINAL_CALL,

	/**
	 * An expected response header or body field was missing.
	 */
	MISSING_FIELD,

	/**
	 * Malformed JSON, PEM or base64 input.
	 */
	DECODE,

	/**
	 * The persistence backend failed.
	 */
	PERSISTENCE,
};

constexpr const char *
AcmeErrorKindToString(AcmeErrorKind kind) noexcept
{
	switch (kind) {
	case AcmeErrorKind::NETWORK:
		return "network";

	case AcmeErrorKind::TERMINAL_CALL:
		return "terminal call";

	case AcmeErrorKind::MISSING_FIELD:
		return "missing field";

	case AcmeErrorKind::DECODE:
		return "decode";

	case AcmeErrorKind::PERSISTENCE:
		return "persistence";
	}

	return "?";
}

class AcmeError : public std::runtime_error {
	AcmeErrorKind kind;

	/**
	 * The HTTP status of the last response (NETWORK and
	 * TERMINAL_CALL only); 0 if no response was received.
	 */
	unsigned status = 0;

	/**
	 * The body of the last response (NETWORK and TERMINAL_CALL
	 * only).
	 */
	std::string body;

	/**
	 * The name of the missing header or field (MISSING_FIELD
	 * only).
	 */
	std::string field;

	/**
	 * The "type" of the RFC 7807 problem document returned by the
	 * server, if any.
	 */
	std::string problem_type;

public:
	AcmeError(AcmeErrorKind _kind, const std::string &msg)
		:std::runtime_error(msg), kind(_kind) {}

	AcmeError(AcmeErrorKind _kind, const std::string &msg,
		  unsigned _status, std::string &&_body,
		  std::string &&_problem_type={})
		:std::runtime_error(msg), kind(_kind),
		 status(_status), body(std::move(_body)),
		 problem_type(std::move(_problem_type)) {}

	struct MissingField {};

	AcmeError(MissingField, const std::string &msg, std::string &&_field)
		:std::runtime_error(msg), kind(AcmeErrorKind::MISSING_FIELD),
		 field(std::move(_field)) {}

	AcmeErrorKind GetKind() const noexcept {
		return kind;
	}

	unsigned GetStatus() const noexcept {
		return status;
	}

	const std::string &GetBody() const noexcept {
		return body;
	}

	const std::string &GetField() const noexcept {
		return field;
	}

	const std::string &GetProblemType() const noexcept {
		return problem_type;
	}
};
