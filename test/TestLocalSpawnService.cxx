// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeJail.hxx"
#include "spawn/Local.hxx"
#include "spawn/Registry.hxx"
#include "spawn/ProcessHandle.hxx"
#include "spawn/ExitListener.hxx"
#include "spawn/Prepared.hxx"
#include "spawn/JailHook.hxx"
#include "spawn/Error.hxx"
#include "event/Loop.hxx"

#include <gtest/gtest.h>

#include <signal.h>

using std::string_view_literals::operator""sv;

namespace {

struct ExitRecorder final : ExitListener {
	EventLoop &event_loop;

	int status = -1;
	bool exited = false;

	explicit ExitRecorder(EventLoop &_event_loop) noexcept
		:event_loop(_event_loop) {}

	/* virtual methods from class ExitListener */
	void OnChildProcessExit(int _status) noexcept override {
		status = _status;
		exited = true;
		event_loop.Break();
	}
};

struct Context {
	EventLoop event_loop;
	ChildProcessRegistry registry{event_loop};
	LocalSpawnService service{registry};
	ExitRecorder recorder{event_loop};

	int Wait(ChildProcessHandle &handle) noexcept {
		handle.SetExitListener(recorder);
		event_loop.Dispatch();
		return recorder.status;
	}
};

/**
 * Block until the given string has been received from the pipe.
 */
static bool
Expect(UniqueFileDescriptor &fd, std::string_view expected) noexcept
{
	std::string received;
	char buffer[64];
	while (received.size() < expected.size()) {
		ssize_t nbytes = fd.Read(buffer, sizeof(buffer));
		if (nbytes <= 0)
			return false;
		received.append(buffer, nbytes);
	}

	return received == expected;
}

} // anonymous namespace

TEST(LocalSpawnService, Exit)
{
	Context c;

	PreparedChildProcess p;
	p.Append("/bin/sh");
	p.Append("-c");
	p.Append("exit 7");

	auto handle = c.service.SpawnChildProcess("exit", std::move(p));
	ASSERT_TRUE(handle);
	EXPECT_EQ(c.registry.GetCount(), 1u);

	const int status = c.Wait(*handle);
	ASSERT_TRUE(c.recorder.exited);
	ASSERT_TRUE(WIFEXITED(status));
	EXPECT_EQ(WEXITSTATUS(status), 7);
	EXPECT_TRUE(c.registry.IsEmpty());
}

TEST(LocalSpawnService, JailHook)
{
	Context c;
	RecordPipe record;

	PreparedChildProcess p;
	p.Append("/bin/true");
	AddJailAttachHook(p, FakeJail{1, 'A', record.w.Get()});

	auto handle = c.service.SpawnChildProcess("jailed", std::move(p));
	const int status = c.Wait(*handle);
	ASSERT_TRUE(WIFEXITED(status));
	EXPECT_EQ(WEXITSTATUS(status), 0);
	EXPECT_EQ(record.ReadAll(), "A");
}

TEST(LocalSpawnService, AttachFailure)
{
	Context c;
	RecordPipe record;

	PreparedChildProcess p;
	p.Append("/bin/true");
	AddJailAttachHook(p, FakeJail{1, 'A', record.w.Get(),
				      JailAttachResult::Failure(JailErrorCode::ATTACH,
								ESRCH)});

	try {
		[[maybe_unused]] auto handle =
			c.service.SpawnChildProcess("jailed", std::move(p));
		FAIL() << "SpawnHookError expected";
	} catch (const SpawnHookError &e) {
		EXPECT_EQ(e.code().value(), ESRCH);
		EXPECT_EQ(e.GetHookIndex(), 0u);
	}

	/* the failed child was never registered and has been reaped */
	EXPECT_TRUE(c.registry.IsEmpty());
	EXPECT_FALSE(HaveChildProcesses());
	EXPECT_EQ(record.ReadAll(), "A");
}

TEST(LocalSpawnService, UnexpectedError)
{
	Context c;
	RecordPipe record, error;

	PreparedChildProcess p;
	p.Append("/bin/true");
	p.SetStderr(std::move(error.w));
	AddJailAttachHook(p, FakeJail{1, 'A', record.w.Get(),
				      JailAttachResult::Failure(JailErrorCode::QUERY,
								EINVAL)});

	/* the abort is not reported as a spawn error; it shows up in
	   the exit status */
	auto handle = c.service.SpawnChildProcess("jailed", std::move(p));
	const int status = c.Wait(*handle);
	ASSERT_TRUE(WIFSIGNALED(status));
	EXPECT_EQ(WTERMSIG(status), SIGABRT);
	EXPECT_EQ(error.ReadAll(),
		  "jail attach failed with unexpected error: query\n"sv);
}

TEST(LocalSpawnService, Kill)
{
	Context c;

	PreparedChildProcess p;
	p.Append("/bin/sleep");
	p.Append("60");

	auto handle = c.service.SpawnChildProcess("sleep", std::move(p));
	handle->SetExitListener(c.recorder);
	handle->Kill(SIGTERM);
	c.event_loop.Dispatch();

	ASSERT_TRUE(c.recorder.exited);
	ASSERT_TRUE(WIFSIGNALED(c.recorder.status));
	EXPECT_EQ(WTERMSIG(c.recorder.status), SIGTERM);
}

TEST(LocalSpawnService, KillTimeout)
{
	Context c;
	c.registry.SetKillTimeout(std::chrono::milliseconds(100));

	RecordPipe output;

	PreparedChildProcess p;
	p.Append("/bin/sh");
	p.Append("-c");
	p.Append("trap '' TERM; echo ready; exec sleep 60");
	p.SetStdout(std::move(output.w));

	auto handle = c.service.SpawnChildProcess("stubborn", std::move(p));

	/* don't send SIGTERM before the trap is installed */
	ASSERT_TRUE(Expect(output.r, "ready\n"));

	handle->SetExitListener(c.recorder);
	handle->Kill(SIGTERM);
	c.event_loop.Dispatch();

	ASSERT_TRUE(c.recorder.exited);
	ASSERT_TRUE(WIFSIGNALED(c.recorder.status));
	EXPECT_EQ(WTERMSIG(c.recorder.status), SIGKILL);
}

TEST(LocalSpawnService, CloseHandle)
{
	Context c;

	PreparedChildProcess p;
	p.Append("/bin/sleep");
	p.Append("60");

	auto handle = c.service.SpawnChildProcess("sleep", std::move(p));
	EXPECT_EQ(c.registry.GetCount(), 1u);

	/* destroying the handle sends SIGTERM; the registry still
	   reaps the process */
	handle.reset();
	c.registry.SetVolatile();

	while (!c.registry.IsEmpty())
		c.event_loop.Dispatch();

	EXPECT_FALSE(c.recorder.exited);
	EXPECT_FALSE(HaveChildProcesses());
}
