// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "system/Error.hxx"

/**
 * A #PreExecHook has failed in the child process; the child was
 * terminated before execve().  code() contains the errno value
 * returned by the hook.
 */
class SpawnHookError : public std::system_error {
	unsigned hook_index;

public:
	SpawnHookError(unsigned _hook_index, int error, const char *msg) noexcept
		:std::system_error(std::error_code(error, ErrnoCategory()), msg),
		 hook_index(_hook_index) {}

	/**
	 * The position of the failed hook in registration order.
	 */
	unsigned GetHookIndex() const noexcept {
		return hook_index;
	}
};
