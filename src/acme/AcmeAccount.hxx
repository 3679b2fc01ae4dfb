// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * The account object returned by the ACME server (RFC 8555 section
 * 7.1.2), plus its URL.
 */
struct AcmeAccount {
	enum class Status : uint8_t {
		VALID,
		DEACTIVATED,
		REVOKED,
	};

	Status status = Status::VALID;

	bool terms_of_service_agreed = false;

	/**
	 * The account URL from the "Location" response header.  This
	 * is the key id of all further requests.
	 */
	std::string location;

	/**
	 * "mailto:" URIs.
	 */
	std::vector<std::string> contact;

	/**
	 * The URL of the account's order list; may be empty.
	 */
	std::string orders;

	bool IsValid() const noexcept {
		return status == Status::VALID;
	}

	/**
	 * Returns the first email address from the "contact" list
	 * without the "mailto:" prefix, or an empty string if there is
	 * none.
	 */
	[[gnu::pure]]
	std::string_view GetEmail() const noexcept;

	/**
	 * Throws AcmeError (kind DECODE) on unknown values.
	 */
	static Status ParseStatus(std::string_view s);

	static constexpr const char *FormatStatus(Status s) noexcept {
		switch (s) {
		case Status::VALID:
			return "valid";

		case Status::DEACTIVATED:
			return "deactivated";

		case Status::REVOKED:
			return "revoked";
		}

		return "?";
	}
};
