// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

/*
 * Log levels:
 *
 * 1 = error
 * 2 = warning
 * 3 = info
 * 4 = verbose/debug
 * 5 = trace
 */

namespace LoggerDetail {

extern unsigned max_level;

[[gnu::pure]]
inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

void
WriteV(std::string_view domain, std::string_view msg) noexcept;

void
VFmt(unsigned level, std::string_view domain,
     fmt::string_view format_str, fmt::format_args args) noexcept;

void
AppendException(std::string &dest, std::exception_ptr ep) noexcept;

template<typename T>
inline void
Append(std::string &dest, const T &value) noexcept
{
	if constexpr (std::is_same_v<T, std::exception_ptr>)
		AppendException(dest, value);
	else if constexpr (std::is_convertible_v<const T &, std::string_view>)
		dest.append(std::string_view{value});
	else
		fmt::format_to(std::back_inserter(dest), "{}", value);
}

} // namespace LoggerDetail

/**
 * Set the maximum level which is still logged.  Messages with a
 * higher level are discarded.  The default is 2.
 */
void
SetLogLevel(unsigned level) noexcept;

/**
 * Concatenate all arguments and write the resulting line to the
 * log.  Arguments may be strings, numbers or a std::exception_ptr
 * (which is formatted with its nested chain).
 */
template<typename... Args>
void
LogConcat(unsigned level, std::string_view domain,
	  const Args&... args) noexcept
{
	if (!LoggerDetail::CheckLevel(level))
		return;

	std::string msg;
	(LoggerDetail::Append(msg, args), ...);
	LoggerDetail::WriteV(domain, msg);
}

template<typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	if (!LoggerDetail::CheckLevel(level))
		return;

	LoggerDetail::VFmt(level, domain, format_str,
			   fmt::make_format_args(args...));
}

/**
 * A logger with a fixed domain name which is prepended to each
 * message.
 */
class LLogger {
	std::string domain;

public:
	explicit LLogger(std::string_view _domain) noexcept
		:domain(_domain) {}

	template<typename... Args>
	void operator()(unsigned level, const Args&... args) const noexcept {
		LogConcat(level, domain, args...);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		LogFmt(level, domain, format_str, std::forward<Args>(args)...);
	}
};
