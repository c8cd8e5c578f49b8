// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Interface.hxx"

class ChildProcessRegistry;

/**
 * A #SpawnService implementation which forks child processes
 * directly from this process (see SpawnChildProcess()) and watches
 * them with a #ChildProcessRegistry.
 */
class LocalSpawnService final : public SpawnService {
	ChildProcessRegistry &registry;

public:
	explicit LocalSpawnService(ChildProcessRegistry &_registry) noexcept
		:registry(_registry) {}

	/* virtual methods from class SpawnService */
	std::unique_ptr<ChildProcessHandle> SpawnChildProcess(std::string_view name,
							      PreparedChildProcess &&params) override;
};
