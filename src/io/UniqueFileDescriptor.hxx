// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <utility>

#include <sys/types.h>
#include <unistd.h>

/**
 * An OO wrapper for a UNIX file descriptor which closes it
 * automatically.
 */
class UniqueFileDescriptor {
	int fd = -1;

public:
	UniqueFileDescriptor() noexcept = default;

	explicit constexpr UniqueFileDescriptor(int _fd) noexcept
		:fd(_fd) {}

	UniqueFileDescriptor(UniqueFileDescriptor &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~UniqueFileDescriptor() noexcept {
		if (IsDefined())
			::close(fd);
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	constexpr int Get() const noexcept {
		return fd;
	}

	int Release() noexcept {
		return std::exchange(fd, -1);
	}

	void Close() noexcept {
		if (IsDefined())
			::close(Release());
	}

	ssize_t Read(void *buffer, std::size_t size) const noexcept {
		return ::read(fd, buffer, size);
	}

	ssize_t Write(const void *buffer, std::size_t size) const noexcept {
		return ::write(fd, buffer, size);
	}

	/**
	 * Create a pipe with both ends marked "close-on-exec".
	 *
	 * @return false on error (errno set)
	 */
	[[nodiscard]]
	static bool CreatePipe(UniqueFileDescriptor &r,
			       UniqueFileDescriptor &w) noexcept;
};
