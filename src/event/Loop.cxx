// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Loop.hxx"

#include <event2/event.h>

#include <cassert>
#include <stdexcept>

static struct event_base *
CreateEventBase()
{
	struct event_base *base = event_base_new();
	if (base == nullptr)
		throw std::runtime_error("event_base_new() failed");

	return base;
}

EventLoop::EventLoop()
	:event_base(CreateEventBase())
{
}

EventLoop::~EventLoop() noexcept
{
	assert(defer.empty());

	event_base_free(event_base);
}

void
EventLoop::Dispatch() noexcept
{
	quit = false;

	RunDeferred();
	while (!quit && Loop(EVLOOP_ONCE))
		RunDeferred();
}

void
EventLoop::LoopNonBlock() noexcept
{
	RunDeferred();
	Loop(EVLOOP_NONBLOCK);
	RunDeferred();
}

void
EventLoop::Break() noexcept
{
	quit = true;
	event_base_loopbreak(event_base);
}

void
EventLoop::Defer(DeferEvent &e) noexcept
{
	defer.push_back(e);
}

void
EventLoop::CancelDefer(DeferEvent &e) noexcept
{
	defer.erase(defer.iterator_to(e));
}

bool
EventLoop::Loop(int flags) noexcept
{
	/* returns 1 if no events are registered */
	return event_base_loop(event_base, flags) == 0;
}

void
EventLoop::RunDeferred() noexcept
{
	while (!defer.empty() && !quit)
		defer.pop_front_and_dispose([](DeferEvent *e){
			e->OnDeferred();
		});
}
