// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RunningJail.hxx"

#include <fmt/format.h>

#include <errno.h>
#include <stdlib.h>
#include <sys/param.h>
#include <sys/jail.h>
#include <jail.h>

RunningJail
RunningJail::FromJid(int jid)
{
	RunningJail jail(jid);

	/* throws if the jail does not exist */
	jail.GetName();

	return jail;
}

RunningJail
RunningJail::FromName(const char *name)
{
	const int jid = jail_getid(name);
	if (jid < 0) {
		const int e = errno;
		throw JailError(JailErrorCode::NOT_FOUND, e,
				fmt::format("No such jail '{}': {}",
					    name, jail_errmsg).c_str());
	}

	return RunningJail(jid);
}

std::string
RunningJail::GetName() const
{
	char *name = jail_getname(jid);
	if (name == nullptr) {
		const int e = errno;
		throw JailError(e == ENOENT
				? JailErrorCode::NOT_FOUND
				: JailErrorCode::QUERY,
				e,
				fmt::format("Failed to query jail {}: {}",
					    jid, jail_errmsg).c_str());
	}

	std::string result(name);
	free(name);
	return result;
}

JailAttachResult
RunningJail::Attach() const noexcept
{
	if (jail_attach(jid) < 0)
		return JailAttachResult::Failure(JailErrorCode::ATTACH, errno);

	return JailAttachResult::Success();
}
