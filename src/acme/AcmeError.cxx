// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AcmeError.hxx"
#include "HttpClient.hxx"
#include "util/Exception.hxx"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using std::string_view_literals::operator""sv;
using json = nlohmann::json;

[[gnu::pure]]
static bool
IsProblemJson(const GlueHttpResponse &response) noexcept
{
	const char *content_type = response.FindHeader("content-type"sv);
	if (content_type == nullptr)
		return false;

	const std::string_view ct{content_type};
	return ct.starts_with("application/problem+json"sv);
}

[[gnu::pure]]
static std::string
GetStringRobust(const json &j, std::string_view name) noexcept
{
	const auto i = j.find(name);
	if (i == j.end() || !i->is_string())
		return {};

	return i->get<std::string>();
}

AcmeError
MakeCallError(AcmeErrorKind kind, GlueHttpResponse &&response) noexcept
{
	const unsigned status = unsigned(response.status);

	std::string msg = kind == AcmeErrorKind::TERMINAL_CALL
		? fmt::format("Request rejected by server ({})", status)
		: fmt::format("Call failed ({})", status);

	std::string problem_type;

	if (IsProblemJson(response)) {
		const auto root = json::parse(response.body, nullptr, false);
		if (root.is_object()) {
			problem_type = GetStringRobust(root, "type"sv);

			const auto detail = GetStringRobust(root, "detail"sv);
			if (!detail.empty()) {
				msg += ": ";
				msg += detail;
			}
		}
	} else if (!response.body.empty()) {
		msg += ": ";
		msg += response.body;
	}

	return {kind, msg, status, std::move(response.body),
		std::move(problem_type)};
}

AcmeError
MakeMissingFieldError(std::string_view name) noexcept
{
	return {
		AcmeError::MissingField{},
		fmt::format("Missing field: {}", name),
		std::string{name},
	};
}

AcmeError
MakeDecodeError(std::string_view msg) noexcept
{
	return {AcmeErrorKind::DECODE, std::string{msg}};
}

bool
IsAcmeErrorType(std::exception_ptr ep, std::string_view type) noexcept
{
	const auto *e = FindNested<AcmeError>(ep);
	return e != nullptr && e->GetProblemType() == type;
}

bool
IsAcmeBadNonceError(std::exception_ptr ep) noexcept
{
	return IsAcmeErrorType(ep, "urn:ietf:params:acme:error:badNonce"sv);
}
