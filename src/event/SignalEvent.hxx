// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Event.hxx"

/**
 * Invoke a callback (inside the event loop, not in signal handler
 * context) whenever the given signal is received.
 */
class SignalEvent {
	Event event;

	bool enabled = false;

public:
	SignalEvent(EventLoop &loop, int signo,
		    event_callback_fn callback, void *ctx) noexcept
		:event(loop, signo, EV_SIGNAL|EV_PERSIST, callback, ctx) {}

	bool IsEnabled() const noexcept {
		return enabled;
	}

	/**
	 * Throws on error.
	 */
	void Enable();

	void Disable() noexcept;
};
