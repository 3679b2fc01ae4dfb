// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AcmeAccount.hxx"
#include "AcmeError.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

std::string_view
AcmeAccount::GetEmail() const noexcept
{
	static constexpr auto prefix = "mailto:"sv;

	for (const std::string_view uri : contact)
		if (uri.starts_with(prefix))
			return uri.substr(prefix.size());

	return {};
}

AcmeAccount::Status
AcmeAccount::ParseStatus(std::string_view s)
{
	for (const auto status : {Status::VALID, Status::DEACTIVATED, Status::REVOKED})
		if (s == FormatStatus(status))
			return status;

	throw MakeDecodeError(fmt::format("Invalid account status '{}'", s));
}
