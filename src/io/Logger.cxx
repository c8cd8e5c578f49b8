// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <sys/uio.h>
#include <unistd.h>

namespace LoggerDetail {

unsigned min_level = 1;

void
WriteLine(std::string_view domain, std::string_view message) noexcept
{
	static constexpr char separator[] = ": ";

	struct iovec v[4];
	std::size_t n = 0;

	if (!domain.empty()) {
		v[n++] = {const_cast<char *>(domain.data()), domain.size()};
		v[n++] = {const_cast<char *>(separator), sizeof(separator) - 1};
	}

	v[n++] = {const_cast<char *>(message.data()), message.size()};
	v[n++] = {const_cast<char *>("\n"), 1};

	/* a logger has no way to report its own failure */
	[[maybe_unused]] auto nbytes = writev(STDERR_FILENO, v, n);
}

void
AppendArg(Buffer &buffer, const std::exception_ptr &ep) noexcept
{
	const auto msg = GetFullMessage(ep);
	buffer.append(msg.data(), msg.data() + msg.size());
}

void
AppendArg(Buffer &buffer, std::exception_ptr &ep) noexcept
{
	AppendArg(buffer, std::as_const(ep));
}

void
AppendArg(Buffer &buffer, std::exception_ptr &&ep) noexcept
{
	AppendArg(buffer, std::as_const(ep));
}

void
AppendArg(Buffer &buffer, const std::exception &e) noexcept
{
	const auto msg = GetFullMessage(e);
	buffer.append(msg.data(), msg.data() + msg.size());
}

void
VFmt(unsigned, std::string_view domain,
     fmt::string_view format_str, fmt::format_args args) noexcept
{
	Buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	WriteLine(domain, {buffer.data(), buffer.size()});
}

} // namespace LoggerDetail

void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::min_level = level;
}
