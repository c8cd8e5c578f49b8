// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <event2/event.h>

#include <boost/intrusive/list_hook.hpp>

class EventLoop;

/**
 * Defer execution until the next event loop iteration.  Use this to
 * move calls out of the current stack frame, to avoid surprising side
 * effects for callers up in the call chain.
 */
class DeferEvent final {
	friend class EventLoop;

	using SiblingsHook = boost::intrusive::list_member_hook<boost::intrusive::link_mode<boost::intrusive::safe_link>>;
	SiblingsHook siblings;

	EventLoop &loop;

	const event_callback_fn callback;
	void *const callback_ctx;

public:
	DeferEvent(EventLoop &_loop,
		   event_callback_fn _callback, void *_ctx) noexcept
		:loop(_loop), callback(_callback), callback_ctx(_ctx) {}

	~DeferEvent() noexcept {
		Cancel();
	}

	DeferEvent(const DeferEvent &) = delete;
	DeferEvent &operator=(const DeferEvent &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return loop;
	}

	bool IsPending() const noexcept {
		return siblings.is_linked();
	}

	void Schedule() noexcept;
	void Cancel() noexcept;

private:
	void OnDeferred() noexcept {
		callback(-1, 0, callback_ctx);
	}
};
