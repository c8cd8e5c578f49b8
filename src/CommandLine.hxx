// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <span>
#include <vector>

struct CommandLine {
	/**
	 * Names (or ids) of the jails to attach to, in this order.
	 */
	std::vector<const char *> jails;

	/**
	 * The working directory of the child process (inside the
	 * jail).
	 */
	const char *chdir = nullptr;

	/**
	 * "NAME=VALUE" strings; if not empty, the child gets only
	 * these instead of the inherited environment.
	 */
	std::vector<const char *> env;

	/**
	 * After forwarding SIGTERM/SIGINT to the child, wait this long
	 * before sending SIGKILL.
	 */
	std::chrono::seconds kill_timeout{10};

	/**
	 * The program path followed by its arguments.
	 */
	std::span<const char *const> program;
};

/**
 * Parse command line options.  Exits the process on usage errors.
 */
void
ParseCommandLine(CommandLine &cmdline, int argc, char **argv);
