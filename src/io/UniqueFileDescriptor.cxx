// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "UniqueFileDescriptor.hxx"

#include <fcntl.h>
#include <unistd.h>

bool
UniqueFileDescriptor::CreatePipe(UniqueFileDescriptor &r,
				 UniqueFileDescriptor &w) noexcept
{
	int fds[2];
	if (pipe2(fds, O_CLOEXEC) < 0)
		return false;

	r = UniqueFileDescriptor(fds[0]);
	w = UniqueFileDescriptor(fds[1]);
	return true;
}
