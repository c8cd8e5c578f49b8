// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <memory>
#include <string_view>

struct PreparedChildProcess;
class ChildProcessHandle;

/**
 * A service which can spawn new child processes and notifies the
 * caller asynchronously when they exit.
 */
class SpawnService {
public:
	/**
	 * Throws on error (e.g. #SpawnHookError if a pre-exec hook
	 * has failed).
	 *
	 * @param name a symbolic name for the process to be used in
	 * log messages
	 */
	virtual std::unique_ptr<ChildProcessHandle> SpawnChildProcess(std::string_view name,
								      PreparedChildProcess &&params) = 0;
};
