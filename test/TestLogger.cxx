// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "io/Logger.hxx"
#include "util/Exception.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using ::testing::internal::CaptureStderr;
using ::testing::internal::GetCapturedStderr;

TEST(Logger, Level)
{
	SetLogLevel(2);

	CaptureStderr();
	LogConcat(1, "test", "error");
	LogConcat(2, "test", "warning");
	LogConcat(3, "test", "info");
	EXPECT_EQ(GetCapturedStderr(), "test: error\ntest: warning\n");

	SetLogLevel(1);
}

TEST(Logger, Concat)
{
	CaptureStderr();
	LogConcat(1, "test", "jail '", "www", "' has jid ", 42);
	LogConcat(1, {}, "no domain");
	EXPECT_EQ(GetCapturedStderr(),
		  "test: jail 'www' has jid 42\nno domain\n");
}

TEST(Logger, Fmt)
{
	CaptureStderr();
	LogFmt(1, "test", "{} {:03}", "x", 7);
	EXPECT_EQ(GetCapturedStderr(), "test: x 007\n");
}

TEST(Logger, LLogger)
{
	const LLogger logger("spawn");
	EXPECT_EQ(logger.GetDomain(), "spawn");
	EXPECT_TRUE(logger.IsVisible(1));
	EXPECT_FALSE(logger.IsVisible(2));

	CaptureStderr();
	logger(1, "pid ", 1234);
	logger.Fmt(1, "pid {}", 5678);
	logger(5, "invisible");
	EXPECT_EQ(GetCapturedStderr(), "spawn: pid 1234\nspawn: pid 5678\n");
}

TEST(Logger, Exception)
{
	std::exception_ptr ep;
	try {
		try {
			throw std::runtime_error("inner");
		} catch (...) {
			std::throw_with_nested(std::runtime_error("outer"));
		}
	} catch (...) {
		ep = std::current_exception();
	}

	EXPECT_EQ(GetFullMessage(ep), "outer; inner");

	CaptureStderr();
	LogConcat(1, "test", "Failed: ", ep);
	LogConcat(1, "test", "Failed: ", std::logic_error("oops"));
	EXPECT_EQ(GetCapturedStderr(),
		  "test: Failed: outer; inner\ntest: Failed: oops\n");
}

TEST(Logger, FormattedErrors)
{
	const auto e = FmtRuntimeError("jail {} not found", 42);
	EXPECT_STREQ(e.what(), "jail 42 not found");

	const auto s = FmtErrno(ENOENT, "Failed to open '{}'", "/x");
	EXPECT_EQ(s.code().value(), ENOENT);
	EXPECT_EQ(GetFullMessage(s).rfind("Failed to open '/x': ", 0), 0u);
}
