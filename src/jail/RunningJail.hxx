// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Error.hxx"

#include <string>

/**
 * A handle for a jail which was started elsewhere.  It is only the
 * jail id; copying it is free, and holding it does not keep the jail
 * alive.
 *
 * This class is only available on FreeBSD.
 */
class RunningJail {
	int jid;

public:
	explicit constexpr RunningJail(int _jid) noexcept
		:jid(_jid) {}

	/**
	 * Look up a jail by its id.
	 *
	 * Throws #JailError if there is no such jail.
	 */
	static RunningJail FromJid(int jid);

	/**
	 * Look up a jail by its name (or by a numeric id string).
	 *
	 * Throws #JailError if there is no such jail.
	 */
	static RunningJail FromName(const char *name);

	constexpr int GetJid() const noexcept {
		return jid;
	}

	/**
	 * Query the jail's name.
	 *
	 * Throws #JailError on error.
	 */
	std::string GetName() const;

	/**
	 * Attach the calling process to this jail.  This is
	 * async-signal-safe and may be called after fork().
	 */
	JailAttachResult Attach() const noexcept;

	constexpr bool operator==(const RunningJail &other) const noexcept {
		return jid == other.jid;
	}
};
