// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Hook.hxx"
#include "jail/Error.hxx"
#include "io/Logger.hxx"

#include <concepts>
#include <type_traits>

#include <errno.h>

/**
 * A handle for a jail which can be captured by a #PreExecHook: a
 * plain value (no pointers into the parent's heap, no locks) with an
 * async-signal-safe Attach() method.
 */
template<typename T>
concept JailHandle = std::is_trivially_copyable_v<T> &&
	requires(const T &jail) {
		{ jail.Attach() } noexcept -> std::same_as<JailAttachResult>;
		{ jail.GetJid() } -> std::convertible_to<int>;
	};

/**
 * Attach() returned an error code other than
 * #JailErrorCode::ATTACH.  Writes a message to stderr and aborts the
 * (child) process.  Async-signal-safe.
 */
[[noreturn]]
void
AbortOnUnexpectedJailError(JailErrorCode code) noexcept;

/**
 * Convert the result of Attach() to the #PreExecHook return value.
 * A failure of any kind other than #JailErrorCode::ATTACH aborts,
 * even if it carries no errno value.
 */
inline int
TranslateJailAttachResult(const JailAttachResult &result) noexcept
{
	if (result.IsOk())
		return 0;

	if (result.code != JailErrorCode::ATTACH)
		AbortOnUnexpectedJailError(result.code);

	/* a failure without errno must not be mistaken for success */
	return result.error != 0 ? result.error : EINVAL;
}

/**
 * Let the child process attach itself to the given jail after fork()
 * and before execve().  If the attach fails, the spawn fails with
 * #SpawnHookError carrying the errno from jail_attach().
 *
 * The handle is copied into the hook.  Calling this more than once
 * adds more hooks; all of them run in registration order.
 *
 * @return the builder
 */
template<PreExecHookHost B, JailHandle J>
B &
AddJailAttachHook(B &builder, const J &jail) noexcept
{
	LogConcat(5, "spawn", "child process will attach to jail ",
		  static_cast<int>(jail.GetJid()));

	builder.AddPreExecHook([jail]() noexcept {
		return TranslateJailAttachResult(jail.Attach());
	});

	return builder;
}
