// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class ExitListener;

/**
 * A handle for a child process which was spawned by a
 * #SpawnService.  Destroying it sends SIGTERM to the child process if
 * it is still running.
 */
class ChildProcessHandle {
public:
	virtual ~ChildProcessHandle() noexcept = default;

	/**
	 * Register a listener which gets notified when the child
	 * process exits.  There can only be one listener.
	 */
	virtual void SetExitListener(ExitListener &listener) noexcept = 0;

	/**
	 * Send a signal to the child process.  If it does not exit
	 * within a certain time, SIGKILL is sent.
	 */
	virtual void Kill(int signo) noexcept = 0;
};
