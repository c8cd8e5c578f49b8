// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "io/Logger.hxx"

#include <gtest/gtest.h>

#include <array>
#include <string_view>

#include <getopt.h>
#include <sysexits.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

namespace {

/**
 * Wrapper for ParseCommandLine() which accepts string literals and
 * resets the getopt() state, so it can be called more than once in
 * one process.
 */
template<std::size_t N>
static void
Parse(CommandLine &cmdline, const std::array<const char *, N> &args)
{
	static std::array<char *, N + 1> argv;
	for (std::size_t i = 0; i < N; ++i)
		argv[i] = const_cast<char *>(args[i]);
	argv[N] = nullptr;

#ifdef __GLIBC__
	optind = 0;
#else
	optind = 1;
	optreset = 1;
#endif

	ParseCommandLine(cmdline, int(N), argv.data());
}

} // anonymous namespace

TEST(CommandLine, Basic)
{
	CommandLine cmdline;
	Parse(cmdline, std::array{"jail-spawn", "-j", "www", "/bin/sh"});

	ASSERT_EQ(cmdline.jails.size(), 1u);
	EXPECT_EQ(cmdline.jails.front(), "www"sv);
	EXPECT_EQ(cmdline.chdir, nullptr);
	EXPECT_TRUE(cmdline.env.empty());
	EXPECT_EQ(cmdline.kill_timeout, std::chrono::seconds(10));
	ASSERT_EQ(cmdline.program.size(), 1u);
	EXPECT_EQ(cmdline.program.front(), "/bin/sh"sv);
}

TEST(CommandLine, Options)
{
	CommandLine cmdline;
	Parse(cmdline, std::array{"jail-spawn",
			"--jail", "outer", "-j", "42",
			"-d", "/var/empty",
			"-e", "PATH=/bin", "--env=TERM=",
			"-t", "3",
			"-v", "-v",
			"/bin/echo", "hello", "world"});

	ASSERT_EQ(cmdline.jails.size(), 2u);
	EXPECT_EQ(cmdline.jails[0], "outer"sv);
	EXPECT_EQ(cmdline.jails[1], "42"sv);
	EXPECT_EQ(cmdline.chdir, "/var/empty"sv);
	ASSERT_EQ(cmdline.env.size(), 2u);
	EXPECT_EQ(cmdline.env[0], "PATH=/bin"sv);
	EXPECT_EQ(cmdline.env[1], "TERM="sv);
	EXPECT_EQ(cmdline.kill_timeout, std::chrono::seconds(3));
	ASSERT_EQ(cmdline.program.size(), 3u);
	EXPECT_EQ(cmdline.program[0], "/bin/echo"sv);
	EXPECT_EQ(cmdline.program[2], "world"sv);

	EXPECT_TRUE(LoggerDetail::CheckLevel(3));
	EXPECT_FALSE(LoggerDetail::CheckLevel(4));
	SetLogLevel(1);
}

TEST(CommandLine, ProgramOptions)
{
	/* options after the program path belong to the program */
	CommandLine cmdline;
	Parse(cmdline, std::array{"jail-spawn", "-j", "www",
			"/bin/ls", "-j", "-l"});

	EXPECT_EQ(cmdline.jails.size(), 1u);
	ASSERT_EQ(cmdline.program.size(), 3u);
	EXPECT_EQ(cmdline.program[1], "-j"sv);
	EXPECT_EQ(cmdline.program[2], "-l"sv);
}

TEST(CommandLine, DoubleDash)
{
	CommandLine cmdline;
	Parse(cmdline, std::array{"jail-spawn", "-j", "www", "--",
			"-weird-program-name"});

	ASSERT_EQ(cmdline.program.size(), 1u);
	EXPECT_EQ(cmdline.program[0], "-weird-program-name"sv);
}

TEST(CommandLine, Quiet)
{
	CommandLine cmdline;
	Parse(cmdline, std::array{"jail-spawn", "-q", "-j", "www",
			"/bin/true"});

	EXPECT_FALSE(LoggerDetail::CheckLevel(1));
	SetLogLevel(1);
}

TEST(CommandLineDeathTest, NoJail)
{
	CommandLine cmdline;
	EXPECT_EXIT(Parse(cmdline, std::array{"jail-spawn", "/bin/true"}),
		    ::testing::ExitedWithCode(EX_USAGE),
		    "No jail specified");
}

TEST(CommandLineDeathTest, EmptyJail)
{
	CommandLine cmdline;
	EXPECT_EXIT(Parse(cmdline, std::array{"jail-spawn", "-j", "",
				"/bin/true"}),
		    ::testing::ExitedWithCode(EX_USAGE),
		    "Empty jail name");
}

TEST(CommandLineDeathTest, NoProgram)
{
	CommandLine cmdline;
	EXPECT_EXIT(Parse(cmdline, std::array{"jail-spawn", "-j", "www"}),
		    ::testing::ExitedWithCode(EX_USAGE),
		    "No program specified");
}

TEST(CommandLineDeathTest, BadEnv)
{
	CommandLine cmdline;
	EXPECT_EXIT(Parse(cmdline, std::array{"jail-spawn", "-j", "www",
				"-e", "=foo", "/bin/true"}),
		    ::testing::ExitedWithCode(EX_USAGE),
		    "Invalid environment variable");
	EXPECT_EXIT(Parse(cmdline, std::array{"jail-spawn", "-j", "www",
				"-e", "FOO", "/bin/true"}),
		    ::testing::ExitedWithCode(EX_USAGE),
		    "Invalid environment variable");
}

TEST(CommandLineDeathTest, BadKillTimeout)
{
	CommandLine cmdline;
	EXPECT_EXIT(Parse(cmdline, std::array{"jail-spawn", "-j", "www",
				"-t", "soon", "/bin/true"}),
		    ::testing::ExitedWithCode(EX_USAGE),
		    "Invalid kill timeout: soon");
	EXPECT_EXIT(Parse(cmdline, std::array{"jail-spawn", "-j", "www",
				"-t", "100000", "/bin/true"}),
		    ::testing::ExitedWithCode(EX_USAGE),
		    "Invalid kill timeout");
}

TEST(CommandLineDeathTest, UnknownOption)
{
	CommandLine cmdline;
	EXPECT_EXIT(Parse(cmdline, std::array{"jail-spawn", "--frobnicate",
				"-j", "www", "/bin/true"}),
		    ::testing::ExitedWithCode(EX_USAGE),
		    "--help");
}
