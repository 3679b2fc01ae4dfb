// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <stdexcept>

[[nodiscard]] [[gnu::pure]]
inline std::runtime_error
VFmtRuntimeError(fmt::string_view format_str, fmt::format_args args) noexcept
{
	return std::runtime_error{fmt::vformat(format_str, args)};
}

template<typename... Args>
[[nodiscard]] [[gnu::pure]]
auto
FmtRuntimeError(fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return VFmtRuntimeError(format_str, fmt::make_format_args(args...));
}
