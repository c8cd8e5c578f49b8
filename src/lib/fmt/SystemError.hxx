// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <system_error>

#include <errno.h>

[[nodiscard]] [[gnu::pure]]
std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename... Args>
[[nodiscard]] [[gnu::pure]]
auto
FmtErrno(int code, fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return VFmtErrno(code, format_str, fmt::make_format_args(args...));
}

template<typename... Args>
[[nodiscard]] [[gnu::pure]]
auto
FmtErrno(fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return FmtErrno(errno, format_str, std::forward<Args>(args)...);
}
