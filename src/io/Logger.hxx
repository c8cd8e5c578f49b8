// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

/**
 * Set the global verbosity.  Messages with a level greater than this
 * are discarded.  Level 0 are fatal errors, 1 errors, 2 warnings, 3
 * important informational messages, 4 informational messages, 5 debug
 * messages.
 */
void
SetLogLevel(unsigned level) noexcept;

namespace LoggerDetail {

extern unsigned min_level;

[[gnu::pure]]
inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= min_level;
}

void
WriteLine(std::string_view domain, std::string_view message) noexcept;

using Buffer = fmt::memory_buffer;

void
AppendArg(Buffer &buffer, const std::exception_ptr &ep) noexcept;

void
AppendArg(Buffer &buffer, std::exception_ptr &ep) noexcept;

void
AppendArg(Buffer &buffer, std::exception_ptr &&ep) noexcept;

void
AppendArg(Buffer &buffer, const std::exception &e) noexcept;

template<typename T>
requires(!std::is_base_of_v<std::exception, std::remove_cvref_t<T>>)
void
AppendArg(Buffer &buffer, T &&value) noexcept
{
	fmt::format_to(std::back_inserter(buffer), "{}",
		       std::forward<T>(value));
}

template<typename... Params>
void
LogConcat(unsigned level, std::string_view domain,
	  Params&&... params) noexcept
{
	if (!CheckLevel(level))
		return;

	Buffer buffer;
	(AppendArg(buffer, std::forward<Params>(params)), ...);
	WriteLine(domain, {buffer.data(), buffer.size()});
}

void
VFmt(unsigned level, std::string_view domain,
     fmt::string_view format_str, fmt::format_args args) noexcept;

} // namespace LoggerDetail

/**
 * Concatenate all parameters (which may be strings, numbers or
 * exceptions) and write the resulting line to the log.
 */
template<typename... Params>
void
LogConcat(unsigned level, std::string_view domain,
	  Params&&... params) noexcept
{
	LoggerDetail::LogConcat(level, domain,
				std::forward<Params>(params)...);
}

template<typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	if (LoggerDetail::CheckLevel(level))
		LoggerDetail::VFmt(level, domain, format_str,
				   fmt::make_format_args(args...));
}

/**
 * A logger which carries a domain name which is prefixed to all
 * messages.
 */
class LLogger {
	std::string domain;

public:
	explicit LLogger(std::string_view _domain) noexcept
		:domain(_domain) {}

	std::string_view GetDomain() const noexcept {
		return domain;
	}

	[[gnu::pure]]
	bool IsVisible(unsigned level) const noexcept {
		return LoggerDetail::CheckLevel(level);
	}

	template<typename... Params>
	void operator()(unsigned level, Params&&... params) const noexcept {
		LogConcat(level, domain, std::forward<Params>(params)...);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		LogFmt(level, domain, format_str,
		       std::forward<Args>(args)...);
	}
};
