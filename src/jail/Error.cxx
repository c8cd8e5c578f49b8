// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"
#include "system/Error.hxx"

const char *
ToString(JailErrorCode code) noexcept
{
	switch (code) {
	case JailErrorCode::ATTACH:
		return "attach";

	case JailErrorCode::NOT_FOUND:
		return "not found";

	case JailErrorCode::QUERY:
		return "query";
	}

	return "unknown";
}

JailError::JailError(JailErrorCode _code, int error, const char *msg) noexcept
	:std::system_error(std::error_code(error, ErrnoCategory()), msg),
	 code(_code) {}
