// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "jail/RunningJail.hxx"
#include "spawn/JailHook.hxx"
#include "spawn/Prepared.hxx"
#include "spawn/Local.hxx"
#include "spawn/Registry.hxx"
#include "spawn/ProcessHandle.hxx"
#include "spawn/ExitListener.hxx"
#include "event/Loop.hxx"
#include "event/SignalEvent.hxx"
#include "event/Callback.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <memory>

#include <signal.h>
#include <stdlib.h>
#include <sys/wait.h>

class Instance final : ExitListener {
	EventLoop event_loop;

	ChildProcessRegistry child_process_registry{event_loop};
	LocalSpawnService spawn_service{child_process_registry};

	SignalEvent sigterm_event, sigint_event;

	std::unique_ptr<ChildProcessHandle> child;

	int exit_status = EXIT_FAILURE;

public:
	Instance()
		:sigterm_event(event_loop, SIGTERM,
			       MakeSimpleEventCallback(Instance, OnShutdownSignal),
			       this),
		 sigint_event(event_loop, SIGINT,
			      MakeSimpleEventCallback(Instance, OnShutdownSignal),
			      this)
	{
		sigterm_event.Enable();
		sigint_event.Enable();
	}

	void SetKillTimeout(std::chrono::steady_clock::duration timeout) noexcept {
		child_process_registry.SetKillTimeout(timeout);
	}

	/**
	 * Throws on error.
	 */
	void Spawn(PreparedChildProcess &&p) {
		child = spawn_service.SpawnChildProcess("jail-spawn", std::move(p));
		child->SetExitListener(*this);
	}

	void Run() noexcept {
		event_loop.Dispatch();
	}

	int GetExitStatus() const noexcept {
		return exit_status;
	}

private:
	void OnShutdownSignal() noexcept {
		LogConcat(4, "jail-spawn", "forwarding shutdown signal to child process");

		sigterm_event.Disable();
		sigint_event.Disable();

		if (child)
			child->Kill(SIGTERM);
	}

	/* virtual methods from class ExitListener */
	void OnChildProcessExit(int status) noexcept override {
		if (WIFSIGNALED(status))
			exit_status = 128 + WTERMSIG(status);
		else
			exit_status = WEXITSTATUS(status);

		child.reset();

		sigterm_event.Disable();
		sigint_event.Disable();
		child_process_registry.SetVolatile();
		event_loop.Break();
	}
};

int
main(int argc, char **argv)
try {
	CommandLine cmdline;
	ParseCommandLine(cmdline, argc, argv);

	PreparedChildProcess p;

	for (const char *name : cmdline.jails) {
		const auto jail = RunningJail::FromName(name);
		LogConcat(4, "jail-spawn", "jail '", name, "' has jid ",
			  jail.GetJid());
		AddJailAttachHook(p, jail);
	}

	p.chdir = cmdline.chdir;

	if (!cmdline.env.empty()) {
		p.clear_env = true;
		for (const char *i : cmdline.env)
			p.PutEnv(i);
	}

	p.Append(cmdline.program);

	Instance instance;
	instance.SetKillTimeout(cmdline.kill_timeout);
	instance.Spawn(std::move(p));
	instance.Run();

	return instance.GetExitStatus();
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
