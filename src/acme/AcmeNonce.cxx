// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AcmeNonce.hxx"
#include "AcmeCaller.hxx"
#include "AcmeDirectory.hxx"
#include "AcmeError.hxx"

using std::string_view_literals::operator""sv;

std::string
RequestAcmeNonce(AcmeCaller &caller, const AcmeDirectory &directory)
{
	LogConcat(5, "acme", "Get new nonce");

	const auto response = caller.Execute(HttpMethod::HEAD,
					     directory.new_nonce.c_str());

	const char *nonce = response.FindHeader("replay-nonce"sv);
	if (nonce == nullptr || *nonce == 0)
		throw MakeMissingFieldError("replay-nonce");

	return nonce;
}
