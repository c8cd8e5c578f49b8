// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Direct.hxx"
#include "Prepared.hxx"
#include "Error.hxx"
#include "lib/fmt/SystemError.hxx"
#include "system/Error.hxx"

#include <fmt/format.h>

#include <cstdint>
#include <stdexcept>

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

/**
 * The record sent by the child process over the status pipe if it
 * fails before execve().
 */
struct SpawnFailure {
	enum class Stage : uint32_t {
		STDIO,
		CHDIR,
		HOOK,
		EXEC,
	};

	Stage stage;

	uint32_t hook_index;

	int error;
};

} // anonymous namespace

[[noreturn]]
static void
ReportFailure(const UniqueFileDescriptor &status_w,
	      SpawnFailure::Stage stage, unsigned hook_index,
	      int error) noexcept
{
	const SpawnFailure failure{stage, hook_index, error};

	/* small pipe writes are atomic; if this fails, the parent sees
	   EOF and the exit status */
	[[maybe_unused]] ssize_t nbytes =
		status_w.Write(&failure, sizeof(failure));

	_exit(EXIT_FAILURE);
}

static bool
DupStdio(const UniqueFileDescriptor &fd, int target_fd) noexcept
{
	if (!fd.IsDefined())
		return true;

	if (fd.Get() == target_fd)
		/* dup2() would be a no-op and leave O_CLOEXEC set */
		return fcntl(target_fd, F_SETFD, 0) == 0;

	return dup2(fd.Get(), target_fd) == target_fd;
}

/**
 * Restore the default action of all signals which have a handler.
 * Ignored signals stay ignored.
 */
static void
ResetSignalHandlers() noexcept
{
	for (int signo = 1; signo < NSIG; ++signo) {
		struct sigaction sa;
		if (sigaction(signo, nullptr, &sa) < 0 ||
		    sa.sa_handler == SIG_DFL || sa.sa_handler == SIG_IGN)
			continue;

		sa = {};
		sa.sa_handler = SIG_DFL;
		sigemptyset(&sa.sa_mask);
		sigaction(signo, &sa, nullptr);
	}
}

/**
 * Move the file descriptor to a number above the standard ones, so
 * the dup2() calls in the child process cannot replace it.
 *
 * @return false on error (errno set)
 */
static bool
MoveAboveStdio(UniqueFileDescriptor &fd) noexcept
{
	if (fd.Get() > STDERR_FILENO)
		return true;

	const int new_fd = fcntl(fd.Get(), F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
	if (new_fd < 0)
		return false;

	fd = UniqueFileDescriptor(new_fd);
	return true;
}

/**
 * This is the code which runs in the forked child process.  Nothing
 * here may allocate memory or throw.
 */
[[noreturn]]
static void
RunChild(const PreparedChildProcess &p,
	 char *const*argv, char *const*envp,
	 const UniqueFileDescriptor &status_w) noexcept
{
	/* the parent's handlers (e.g. libevent's) must not run here */
	ResetSignalHandlers();

	sigset_t mask;
	sigemptyset(&mask);
	sigprocmask(SIG_SETMASK, &mask, nullptr);

	if (!DupStdio(p.stdin_fd, STDIN_FILENO) ||
	    !DupStdio(p.stdout_fd, STDOUT_FILENO) ||
	    !DupStdio(p.stderr_fd, STDERR_FILENO))
		ReportFailure(status_w, SpawnFailure::Stage::STDIO, 0, errno);

	unsigned i = 0;
	for (const auto &hook : p.pre_exec_hooks) {
		if (const int error = hook(); error != 0)
			ReportFailure(status_w, SpawnFailure::Stage::HOOK,
				      i, error);
		++i;
	}

	/* after the hooks, because jail_attach() changes to the jail's
	   root directory; the path is resolved inside the jail */
	if (p.chdir != nullptr && chdir(p.chdir) < 0)
		ReportFailure(status_w, SpawnFailure::Stage::CHDIR, 0, errno);

	if (envp != nullptr)
		execve(argv[0], argv, envp);
	else
		execv(argv[0], argv);

	ReportFailure(status_w, SpawnFailure::Stage::EXEC, 0, errno);
}

static void
ReapChild(pid_t pid) noexcept
{
	int status;
	while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

[[noreturn]]
static void
ThrowFailure(const PreparedChildProcess &p, const SpawnFailure &failure)
{
	switch (failure.stage) {
	case SpawnFailure::Stage::STDIO:
		throw MakeErrno(failure.error,
				"Failed to set up standard file descriptors");

	case SpawnFailure::Stage::CHDIR:
		throw FmtErrno(failure.error,
			       "Failed to change to directory '{}'",
			       p.chdir);

	case SpawnFailure::Stage::HOOK:
		throw SpawnHookError(failure.hook_index, failure.error,
				     fmt::format("Pre-exec hook #{} failed for '{}'",
						 failure.hook_index,
						 p.GetPath()).c_str());

	case SpawnFailure::Stage::EXEC:
		break;
	}

	throw FmtErrno(failure.error, "Failed to execute '{}'", p.GetPath());
}

SpawnChildProcessResult
SpawnChildProcess(PreparedChildProcess &&p)
{
	if (p.args.empty())
		throw std::invalid_argument("No executable");

	/* allocate everything the child needs before forking */
	const auto argv = p.MakeArgv();
	const auto envp = p.MakeEnvp();

	UniqueFileDescriptor status_r, status_w;
	if (!UniqueFileDescriptor::CreatePipe(status_r, status_w))
		throw MakeErrno("pipe() failed");

	if (!MoveAboveStdio(status_r) || !MoveAboveStdio(status_w))
		throw MakeErrno("Failed to duplicate status pipe");

	const pid_t pid = fork();
	if (pid < 0)
		throw MakeErrno("fork() failed");

	if (pid == 0)
		RunChild(p, argv.data(),
			 envp.empty() ? nullptr : envp.data(),
			 status_w);

	status_w.Close();

	/* the child has its own copies now */
	p.stdin_fd.Close();
	p.stdout_fd.Close();
	p.stderr_fd.Close();

	SpawnFailure failure;
	ssize_t nbytes;
	do {
		nbytes = status_r.Read(&failure, sizeof(failure));
	} while (nbytes < 0 && errno == EINTR);

	if (nbytes == 0)
		/* EOF: the status pipe was closed by execve() (or the
		   child has died) */
		return {pid};

	const int e = errno;
	ReapChild(pid);

	if (nbytes < 0)
		throw MakeErrno(e, "Failed to read from status pipe");

	if (std::size_t(nbytes) != sizeof(failure))
		throw std::runtime_error("Malformed record on status pipe");

	ThrowFailure(p, failure);
}

int
WaitChildProcess(pid_t pid)
{
	int status;
	while (waitpid(pid, &status, 0) < 0)
		if (errno != EINTR)
			throw FmtErrno("waitpid({}) failed", pid);

	return status;
}
