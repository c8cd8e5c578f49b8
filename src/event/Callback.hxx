// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * C++ wrappers for the libevent callback.
 */

#pragma once

#include <event2/util.h>

template<class T, void (T::*member)()>
struct SimpleEventCallback {
	static void Callback([[maybe_unused]] evutil_socket_t fd,
			     [[maybe_unused]] short events,
			     void *ctx) noexcept {
		T &t = *(T *)ctx;
		(t.*member)();
	}
};

/* need C++ N3601 to do this without macros */
#define MakeSimpleEventCallback(T, C) SimpleEventCallback<T, &T::C>::Callback
