// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Prepared.hxx"

void
PreparedChildProcess::SetEnv(std::string_view name,
			     std::string_view value) noexcept
{
	std::string s;
	s.reserve(name.size() + 1 + value.size());
	s.append(name);
	s.push_back('=');
	s.append(value);

	/* the nullptr placeholder is resolved by MakeEnvp(), because
	   growing #env_strings may move short (SSO) strings */
	env_strings.emplace_back(std::move(s));
	env.push_back(nullptr);
}

static char *
Deconst(const char *p) noexcept
{
	/* execve() wants non-const pointers, but never modifies the
	   strings */
	return const_cast<char *>(p);
}

std::vector<char *>
PreparedChildProcess::MakeArgv() const noexcept
{
	std::vector<char *> argv;
	argv.reserve(args.size() + 1);
	for (const char *i : args)
		argv.push_back(Deconst(i));
	argv.push_back(nullptr);
	return argv;
}

std::vector<char *>
PreparedChildProcess::MakeEnvp() const noexcept
{
	std::vector<char *> envp;
	if (env.empty() && !clear_env)
		return envp;

	envp.reserve(env.size() + 1);

	auto s = env_strings.begin();
	for (const char *i : env) {
		if (i == nullptr)
			/* placeholder for a SetEnv() string */
			i = (s++)->c_str();

		envp.push_back(Deconst(i));
	}

	envp.push_back(nullptr);
	return envp;
}
