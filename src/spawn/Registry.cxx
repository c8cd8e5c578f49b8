// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Registry.hxx"
#include "ExitListener.hxx"
#include "event/Callback.hxx"
#include "io/Logger.hxx"

#include <cassert>

#include <errno.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/wait.h>

ChildProcessRegistry::ChildProcess::ChildProcess(ChildProcessRegistry &_registry,
						 pid_t _pid,
						 std::string_view _name,
						 ExitListener *_listener) noexcept
	:registry(_registry), pid(_pid), name(_name),
	 start_time(std::chrono::steady_clock::now()),
	 listener(_listener),
	 kill_timeout_event(registry.GetEventLoop(),
			    MakeSimpleEventCallback(ChildProcess,
						    KillTimeoutCallback),
			    this) {}

static constexpr double
ToDouble(const struct timeval &tv) noexcept
{
	return tv.tv_sec + tv.tv_usec / 1000000.;
}

inline void
ChildProcessRegistry::ChildProcess::OnExit(int status,
					   const struct rusage &rusage) noexcept
{
	if (WIFSIGNALED(status)) {
		unsigned level = 1;
		if (!WCOREDUMP(status) && WTERMSIG(status) == SIGTERM)
			level = 4;

		LogFmt(level, "spawn",
		       "child process '{}' (pid {}) died from signal {}{}",
		       name, pid, WTERMSIG(status),
		       WCOREDUMP(status) ? " (core dumped)" : "");
	} else if (WEXITSTATUS(status) == 0)
		LogFmt(5, "spawn",
		       "child process '{}' (pid {}) exited with success",
		       name, pid);
	else
		LogFmt(2, "spawn",
		       "child process '{}' (pid {}) exited with status {}",
		       name, pid, WEXITSTATUS(status));

	const std::chrono::duration<double> elapsed =
		std::chrono::steady_clock::now() - start_time;

	LogFmt(6, "spawn",
	       "stats on '{}' (pid {}): {:1.3f}s elapsed, {:1.3f}s user, {:1.3f}s sys, {}/{} faults, {}/{} switches",
	       name, pid, elapsed.count(),
	       ToDouble(rusage.ru_utime), ToDouble(rusage.ru_stime),
	       rusage.ru_minflt, rusage.ru_majflt,
	       rusage.ru_nvcsw, rusage.ru_nivcsw);

	if (listener != nullptr)
		listener->OnChildProcessExit(status);
}

inline void
ChildProcessRegistry::ChildProcess::KillTimeoutCallback() noexcept
{
	LogFmt(3, "spawn",
	       "sending SIGKILL to child process '{}' (pid {}) due to timeout",
	       name, pid);

	if (kill(pid, SIGKILL) < 0)
		LogFmt(1, "spawn",
		       "failed to kill child process '{}' (pid {}): {}",
		       name, pid, strerror(errno));
}

ChildProcessRegistry::ChildProcessRegistry(EventLoop &_event_loop)
	:event_loop(_event_loop),
	 sigchld_event(event_loop, SIGCHLD,
		       MakeSimpleEventCallback(ChildProcessRegistry, OnSigchld),
		       this),
	 defer_event(event_loop,
		     MakeSimpleEventCallback(ChildProcessRegistry, OnSigchld),
		     this)
{
	sigchld_event.Enable();
}

ChildProcessRegistry::~ChildProcessRegistry() noexcept
{
	/* abandon all remaining child processes; they will be reaped
	   by whoever inherits them */
	children.clear_and_dispose([](ChildProcess *child){
		delete child;
	});

	sigchld_event.Disable();
}

ChildProcessRegistry::ChildProcess *
ChildProcessRegistry::FindByPid(pid_t pid) noexcept
{
	auto i = children.find(pid, ChildProcess::Compare());
	if (i == children.end())
		return nullptr;

	return &*i;
}

void
ChildProcessRegistry::Remove(ChildProcess &child) noexcept
{
	assert(!children.empty());

	child.kill_timeout_event.Cancel();

	children.erase(children.iterator_to(child));
}

void
ChildProcessRegistry::CheckVolatileEvent() noexcept
{
	if (volatile_event && children.empty()) {
		sigchld_event.Disable();
		defer_event.Cancel();
	}
}

void
ChildProcessRegistry::SetVolatile() noexcept
{
	volatile_event = true;
	CheckVolatileEvent();
}

void
ChildProcessRegistry::Add(pid_t pid, std::string_view name,
			  ExitListener *listener) noexcept
{
	assert(pid > 0);
	assert(FindByPid(pid) == nullptr);

	LogFmt(5, "spawn", "added child process '{}' (pid {})", name, pid);

	auto *child = new ChildProcess(*this, pid, name, listener);
	children.insert(*child);

	if (!sigchld_event.IsEnabled()) {
		/* the handler was disabled by CheckVolatileEvent() */
		try {
			sigchld_event.Enable();
		} catch (const std::exception &e) {
			LogConcat(1, "spawn", "Failed to enable SIGCHLD handler: ",
				  e);
		}
	}

	/* schedule an immediate waitpid() run, just in case we lost a
	   SIGCHLD */
	defer_event.Schedule();
}

void
ChildProcessRegistry::SetExitListener(pid_t pid,
				      ExitListener *listener) noexcept
{
	auto *child = FindByPid(pid);
	if (child == nullptr)
		/* already exited */
		return;

	assert(child->listener == nullptr || listener == nullptr);

	child->listener = listener;
}

void
ChildProcessRegistry::Kill(pid_t pid, int signo) noexcept
{
	auto *child = FindByPid(pid);
	if (child == nullptr)
		/* already exited */
		return;

	LogFmt(5, "spawn", "sending {} to child process '{}' (pid {})",
	       strsignal(signo), child->name, pid);

	if (kill(pid, signo) < 0) {
		LogFmt(1, "spawn",
		       "failed to kill child process '{}' (pid {}): {}",
		       child->name, pid, strerror(errno));

		/* if we can't kill the process, we can't do much, so
		   let's just ignore the process from now on and don't
		   let it delay the shutdown */
		Remove(*child);
		delete child;
		CheckVolatileEvent();
		return;
	}

	child->kill_timeout_event.Schedule(kill_timeout);
}

void
ChildProcessRegistry::OnSigchld() noexcept
{
	pid_t pid;
	int status;

	struct rusage rusage;
	while ((pid = wait4(-1, &status, WNOHANG, &rusage)) > 0) {
		auto *child = FindByPid(pid);
		if (child != nullptr) {
			Remove(*child);
			child->OnExit(status, rusage);
			delete child;
		}
	}

	CheckVolatileEvent();
}
