// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/SignalEvent.hxx"
#include "event/DeferEvent.hxx"
#include "event/TimerEvent.hxx"

#include <boost/intrusive/set.hpp>

#include <chrono>
#include <string>
#include <string_view>

#include <sys/types.h>

struct rusage;
class ExitListener;

/**
 * Keeps track of child processes and reaps them when they exit
 * (SIGCHLD).
 */
class ChildProcessRegistry {
	struct ChildProcess
		: boost::intrusive::set_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>> {

		ChildProcessRegistry &registry;

		const pid_t pid;

		const std::string name;

		/**
		 * When this child process was started (registered in
		 * this class).
		 */
		const std::chrono::steady_clock::time_point start_time;

		ExitListener *listener;

		/**
		 * This timer is set up by Kill().  If the child
		 * process hasn't exited after a certain amount of
		 * time, we send SIGKILL.
		 */
		TimerEvent kill_timeout_event;

		ChildProcess(ChildProcessRegistry &_registry,
			     pid_t _pid, std::string_view _name,
			     ExitListener *_listener) noexcept;

		void OnExit(int status, const struct rusage &rusage) noexcept;

		void KillTimeoutCallback() noexcept;

		struct Compare {
			bool operator()(const ChildProcess &a, const ChildProcess &b) const noexcept {
				return a.pid < b.pid;
			}

			bool operator()(const ChildProcess &a, pid_t b) const noexcept {
				return a.pid < b;
			}

			bool operator()(pid_t a, const ChildProcess &b) const noexcept {
				return a < b.pid;
			}
		};
	};

	EventLoop &event_loop;

	boost::intrusive::set<ChildProcess,
			      boost::intrusive::compare<ChildProcess::Compare>,
			      boost::intrusive::constant_time_size<true>> children;

	SignalEvent sigchld_event;

	/**
	 * This event is used to invoke OnSigchld() as soon as possible
	 * after registering a new child, to catch up with SIGCHLDs
	 * that may have been lost while the SIGCHLD handler was
	 * disabled.
	 */
	DeferEvent defer_event;

	std::chrono::steady_clock::duration kill_timeout = std::chrono::minutes(1);

	/**
	 * If true, then the SIGCHLD handler is disabled as soon as the
	 * last child process has exited, allowing the event loop to
	 * finish.
	 */
	bool volatile_event = false;

public:
	/**
	 * Throws if the SIGCHLD handler cannot be installed.
	 */
	explicit ChildProcessRegistry(EventLoop &_event_loop);

	~ChildProcessRegistry() noexcept;

	ChildProcessRegistry(const ChildProcessRegistry &) = delete;
	ChildProcessRegistry &operator=(const ChildProcessRegistry &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return event_loop;
	}

	bool IsEmpty() const noexcept {
		return children.empty();
	}

	std::size_t GetCount() const noexcept {
		return children.size();
	}

	void SetKillTimeout(std::chrono::steady_clock::duration _timeout) noexcept {
		kill_timeout = _timeout;
	}

	/**
	 * Unregister the SIGCHLD handler as soon as no child processes
	 * are left, so the event loop may finish.
	 */
	void SetVolatile() noexcept;

	/**
	 * Register a new child process.
	 *
	 * @param name a symbolic name for the process to be used in
	 * log messages
	 * @param listener an optional listener which is invoked when
	 * the child process exits
	 */
	void Add(pid_t pid, std::string_view name,
		 ExitListener *listener) noexcept;

	/**
	 * Replace the listener of a child process; nullptr unregisters
	 * it.  Does nothing if the process has already been reaped.
	 */
	void SetExitListener(pid_t pid, ExitListener *listener) noexcept;

	/**
	 * Send a signal to a child process.  If the process does not
	 * exit within the kill timeout, it gets SIGKILL.
	 */
	void Kill(pid_t pid, int signo) noexcept;

private:
	[[gnu::pure]]
	ChildProcess *FindByPid(pid_t pid) noexcept;

	void Remove(ChildProcess &child) noexcept;

	void CheckVolatileEvent() noexcept;

	void OnSigchld() noexcept;
};
