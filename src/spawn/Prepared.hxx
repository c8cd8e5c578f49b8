// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Hook.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * Describes a child process which is about to be spawned.
 */
struct PreparedChildProcess {
	/**
	 * The argument vector; the first element is the path of the
	 * executable.
	 */
	std::vector<const char *> args;

	/**
	 * The environment of the new process.  If this is empty (and
	 * #clear_env is false), the parent's environment is inherited.
	 */
	std::vector<const char *> env;

	/**
	 * Owns the strings referenced by #env which were built by
	 * SetEnv().
	 */
	std::vector<std::string> env_strings;

	/**
	 * Start with an empty environment even if #env is empty.
	 */
	bool clear_env = false;

	/**
	 * Change to this directory after the hooks have run (i.e. inside
	 * the jail).
	 */
	const char *chdir = nullptr;

	UniqueFileDescriptor stdin_fd, stdout_fd, stderr_fd;

	/**
	 * Invoked in the child process in this order.
	 */
	std::vector<PreExecHook> pre_exec_hooks;

	PreparedChildProcess() noexcept = default;
	PreparedChildProcess(PreparedChildProcess &&) noexcept = default;
	PreparedChildProcess &operator=(PreparedChildProcess &&) noexcept = default;

	const char *GetPath() const noexcept {
		return args.empty() ? nullptr : args.front();
	}

	void Append(const char *arg) noexcept {
		args.push_back(arg);
	}

	void Append(std::span<const char *const> _args) noexcept {
		args.insert(args.end(), _args.begin(), _args.end());
	}

	/**
	 * Add a "NAME=VALUE" string.  The string is not copied; it must
	 * remain valid until the process is spawned.
	 */
	void PutEnv(const char *p) noexcept {
		env.push_back(p);
	}

	/**
	 * Add an environment variable; the strings are copied.
	 */
	void SetEnv(std::string_view name, std::string_view value) noexcept;

	void SetStdin(UniqueFileDescriptor fd) noexcept {
		stdin_fd = std::move(fd);
	}

	void SetStdout(UniqueFileDescriptor fd) noexcept {
		stdout_fd = std::move(fd);
	}

	void SetStderr(UniqueFileDescriptor fd) noexcept {
		stderr_fd = std::move(fd);
	}

	/**
	 * Register a callback which shall be invoked in the child
	 * process after fork() and before execve().  Each call adds
	 * another hook; they run in registration order, and the first
	 * failure stops the sequence.
	 */
	void AddPreExecHook(PreExecHook hook) noexcept {
		pre_exec_hooks.emplace_back(std::move(hook));
	}

	/**
	 * Build a null-terminated argument vector for execve().
	 */
	std::vector<char *> MakeArgv() const noexcept;

	/**
	 * Build a null-terminated environment vector for execve(), or
	 * an empty vector if the parent's environment shall be
	 * inherited.
	 */
	std::vector<char *> MakeEnvp() const noexcept;
};
