// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "JailHook.hxx"

#include <stdlib.h>
#include <string.h>
#include <unistd.h>

static void
WriteStderr(const char *s) noexcept
{
	[[maybe_unused]] ssize_t nbytes = write(STDERR_FILENO, s, strlen(s));
}

void
AbortOnUnexpectedJailError(JailErrorCode code) noexcept
{
	WriteStderr("jail attach failed with unexpected error: ");
	WriteStderr(ToString(code));
	WriteStderr("\n");
	abort();
}
