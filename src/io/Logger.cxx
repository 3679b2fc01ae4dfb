// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <stdio.h>

namespace LoggerDetail {

unsigned max_level = 2;

void
WriteV(std::string_view domain, std::string_view msg) noexcept
{
	if (domain.empty())
		fmt::print(stderr, "{}\n", msg);
	else
		fmt::print(stderr, "{}: {}\n", domain, msg);
}

void
VFmt(unsigned, std::string_view domain,
     fmt::string_view format_str, fmt::format_args args) noexcept
{
	const auto msg = fmt::vformat(format_str, args);
	WriteV(domain, msg);
}

void
AppendException(std::string &dest, std::exception_ptr ep) noexcept
{
	dest += GetFullMessage(ep);
}

} // namespace LoggerDetail

void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}
