// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SignalEvent.hxx"

#include <stdexcept>

void
SignalEvent::Enable()
{
	if (enabled)
		return;

	if (!event.Add())
		throw std::runtime_error("Failed to register signal event");

	enabled = true;
}

void
SignalEvent::Disable() noexcept
{
	if (!enabled)
		return;

	event.Delete();
	enabled = false;
}
