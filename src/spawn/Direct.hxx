// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/types.h>

struct PreparedChildProcess;

struct SpawnChildProcessResult {
	pid_t pid;
};

/**
 * Fork a child process, run its #PreExecHook callbacks and execute
 * the program.  This function returns after the child has called
 * execve() successfully or has died.
 *
 * Throws #SpawnHookError if a hook has failed, std::system_error if
 * the program could not be executed or if fork() failed.  In all
 * these cases, the child process has already been reaped.
 *
 * A child which terminates abnormally before execve() (e.g. due to
 * abort()) does not cause an exception; its exit status tells.
 */
[[nodiscard]]
SpawnChildProcessResult
SpawnChildProcess(PreparedChildProcess &&params);

/**
 * Wait for the specified child process to exit.
 *
 * Throws on error.
 *
 * @return the status as returned by waitpid()
 */
int
WaitChildProcess(pid_t pid);
