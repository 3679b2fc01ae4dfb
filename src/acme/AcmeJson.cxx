// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AcmeJson.hxx"
#include "AcmeDirectory.hxx"
#include "AcmeAccount.hxx"
#include "AcmeError.hxx"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using std::string_view_literals::operator""sv;

template<typename T>
static void
GetOptional(const nlohmann::json &j, std::string_view name, T &value)
{
	if (const auto i = j.find(name); i != j.end() && !i->is_null())
		i->get_to(value);
}

void
from_json(const nlohmann::json &j, AcmeDirectory &directory)
{
	j.at("newNonce"sv).get_to(directory.new_nonce);
	j.at("newAccount"sv).get_to(directory.new_account);
	j.at("newOrder"sv).get_to(directory.new_order);

	GetOptional(j, "revokeCert"sv, directory.revoke_cert);
	GetOptional(j, "keyChange"sv, directory.key_change);

	if (const auto meta = j.find("meta"sv);
	    meta != j.end() && meta->is_object()) {
		GetOptional(*meta, "termsOfService"sv,
			    directory.terms_of_service);
		GetOptional(*meta, "website"sv, directory.website);
		GetOptional(*meta, "caaIdentities"sv,
			    directory.caa_identities);
		GetOptional(*meta, "externalAccountRequired"sv,
			    directory.external_account_required);
	}

	for (const auto &i : j.items())
		if (i.value().is_string())
			directory.entries.emplace(i.key(),
						  i.value().get<std::string>());
}

nlohmann::json
MakeNewAccountRequest(const char *email) noexcept
{
	nlohmann::json request = nlohmann::json::object();
	request["termsOfServiceAgreed"] = true;

	if (email != nullptr)
		request["contact"].push_back(fmt::format("mailto:{}", email));

	return request;
}

inline void
from_json(const nlohmann::json &j, AcmeAccount::Status &status)
{
	status = AcmeAccount::ParseStatus(j.get<std::string_view>());
}

void
from_json(const nlohmann::json &j, AcmeAccount &account)
{
	if (!j.is_object())
		throw MakeDecodeError("ACME account is not an object");

	j.at("status"sv).get_to(account.status);
	GetOptional(j, "termsOfServiceAgreed"sv, account.terms_of_service_agreed);
	GetOptional(j, "contact"sv, account.contact);
	GetOptional(j, "orders"sv, account.orders);
}
