// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <system_error>

/**
 * The reason why a jail operation has failed.
 */
enum class JailErrorCode : uint_least8_t {
	/**
	 * jail_attach() was rejected by the kernel (jail gone, jail
	 * dying, insufficient privilege).
	 */
	ATTACH,

	/**
	 * No jail with the given name or id exists.
	 */
	NOT_FOUND,

	/**
	 * Querying jail parameters failed.
	 */
	QUERY,
};

[[gnu::const]]
const char *
ToString(JailErrorCode code) noexcept;

/**
 * The outcome of RunningJail::Attach().  This is a plain value which
 * can be created and inspected between fork() and execve(): no
 * allocation, no exceptions.
 */
struct JailAttachResult {
	bool ok = true;

	/**
	 * Only meaningful if #ok is false.
	 */
	JailErrorCode code = JailErrorCode::ATTACH;

	/**
	 * The errno value.  Only meaningful if #ok is false.
	 */
	int error = 0;

	static constexpr JailAttachResult Success() noexcept {
		return {};
	}

	static constexpr JailAttachResult Failure(JailErrorCode code,
						  int error) noexcept {
		return {false, code, error};
	}

	constexpr bool IsOk() const noexcept {
		return ok;
	}
};

/**
 * Exception thrown by jail operations in the parent process.
 */
class JailError : public std::system_error {
	JailErrorCode code;

public:
	JailError(JailErrorCode _code, int error, const char *msg) noexcept;

	JailErrorCode GetCode() const noexcept {
		return code;
	}
};
