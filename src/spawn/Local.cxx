// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Local.hxx"
#include "Direct.hxx"
#include "Prepared.hxx"
#include "ProcessHandle.hxx"
#include "Registry.hxx"

#include <signal.h>

class LocalChildProcess final : public ChildProcessHandle {
	ChildProcessRegistry &registry;

	const pid_t pid;

	bool killed = false;

public:
	LocalChildProcess(ChildProcessRegistry &_registry,
			  pid_t _pid) noexcept
		:registry(_registry), pid(_pid) {}

	~LocalChildProcess() noexcept override {
		registry.SetExitListener(pid, nullptr);

		if (!killed)
			registry.Kill(pid, SIGTERM);
	}

	/* virtual methods from class ChildProcessHandle */
	void SetExitListener(ExitListener &listener) noexcept override {
		registry.SetExitListener(pid, &listener);
	}

	void Kill(int signo) noexcept override {
		killed = true;
		registry.Kill(pid, signo);
	}
};

std::unique_ptr<ChildProcessHandle>
LocalSpawnService::SpawnChildProcess(std::string_view name,
				     PreparedChildProcess &&params)
{
	const auto result = ::SpawnChildProcess(std::move(params));

	registry.Add(result.pid, name, nullptr);
	return std::make_unique<LocalChildProcess>(registry, result.pid);
}
