// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AcmeDirectory.hxx"
#include "AcmeCaller.hxx"
#include "AcmeError.hxx"
#include "AcmeJson.hxx"

#include <nlohmann/json.hpp>

AcmeDirectory
FetchAcmeDirectory(AcmeCaller &caller, const char *url)
{
	auto response = caller.Execute(HttpMethod::GET, url);

	try {
		return nlohmann::json::parse(response.body).get<AcmeDirectory>();
	} catch (const nlohmann::json::exception &) {
		std::throw_with_nested(MakeDecodeError("Malformed ACME directory"));
	}
}
