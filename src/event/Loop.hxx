// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "DeferEvent.hxx"

#include <boost/intrusive/list.hpp>

struct event_base;

/**
 * Wrapper for a struct event_base.
 */
class EventLoop {
	struct event_base *const event_base;

	boost::intrusive::list<DeferEvent,
			       boost::intrusive::member_hook<DeferEvent,
							     DeferEvent::SiblingsHook,
							     &DeferEvent::siblings>,
			       boost::intrusive::constant_time_size<false>> defer;

	bool quit = false;

public:
	/**
	 * Throws std::runtime_error on error.
	 */
	EventLoop();

	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	struct event_base *Get() const noexcept {
		return event_base;
	}

	/**
	 * Run the loop until Break() is called or until no events are
	 * registered anymore.
	 */
	void Dispatch() noexcept;

	/**
	 * Handle all pending events without blocking.
	 */
	void LoopNonBlock() noexcept;

	void Break() noexcept;

	void Defer(DeferEvent &e) noexcept;
	void CancelDefer(DeferEvent &e) noexcept;

private:
	bool Loop(int flags) noexcept;

	void RunDeferred() noexcept;
};
