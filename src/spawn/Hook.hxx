// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <concepts>
#include <functional>
#include <utility>

/**
 * A callback which is invoked in the child process after fork() and
 * before execve().
 *
 * It runs in a restricted environment: the child is a copy of a
 * possibly multi-threaded parent, so it must not allocate memory,
 * acquire locks or throw exceptions; only async-signal-safe functions
 * may be called.
 *
 * @return 0 on success or an errno value; a non-zero value aborts the
 * spawn, and the parent throws #SpawnHookError
 */
using PreExecHook = std::function<int()>;

/**
 * A process builder which can run #PreExecHook callbacks.
 */
template<typename T>
concept PreExecHookHost = requires(T &builder, PreExecHook hook) {
	builder.AddPreExecHook(std::move(hook));
};
