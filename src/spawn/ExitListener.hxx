// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class ExitListener {
public:
	/**
	 * @param status the status as returned by waitpid()
	 */
	virtual void OnChildProcessExit(int status) noexcept = 0;
};
