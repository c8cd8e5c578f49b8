// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Event.hxx"

#include <chrono>

/**
 * Invoke an event callback after a certain amount of time.
 */
class TimerEvent {
	Event event;

public:
	TimerEvent(EventLoop &loop,
		   event_callback_fn callback, void *ctx) noexcept
		:event(loop, -1, 0, callback, ctx) {}

	bool IsPending() const noexcept {
		return event.IsTimerPending();
	}

	void Schedule(std::chrono::steady_clock::duration d) noexcept {
		const auto us = std::chrono::duration_cast<std::chrono::microseconds>(d).count();
		const struct timeval tv{
			.tv_sec = time_t(us / 1000000),
			.tv_usec = suseconds_t(us % 1000000),
		};

		event.Add(tv);
	}

	void Cancel() noexcept {
		event.Delete();
	}
};
