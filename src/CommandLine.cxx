// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "io/Logger.hxx"
#include "version.h"

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <getopt.h>
#include <string.h>
#include <sysexits.h> // for EX_*

static void
PrintUsage()
{
	puts("usage: jail-spawn [options] -j JAIL [--] PROGRAM [ARGS...]\n\n"
	     "valid options:\n"
	     " -h, --help             help (this text)\n"
	     " -V, --version          show jail-spawn version\n"
	     " -v, --verbose          be more verbose\n"
	     " -q, --quiet            be quiet\n"
	     " -j, --jail JAIL        attach the program to this jail (name or jid);\n"
	     "                        may be specified more than once\n"
	     " -d, --chdir DIR        change to this directory inside the jail\n"
	     " -e, --env NAME=VALUE   set an environment variable; if specified,\n"
	     "                        the environment is not inherited\n"
	     " -t, --kill-timeout S   after forwarding SIGTERM/SIGINT, send SIGKILL\n"
	     "                        after S seconds (default 10)\n"
	     "\n"
	     );
}

static void arg_error(const char *argv0, const char *fmt, ...)
	__attribute__ ((noreturn))
	__attribute__((format(printf,2,3)));
static void arg_error(const char *argv0, const char *fmt, ...) {
	if (fmt != nullptr) {
		va_list ap;

		fputs(argv0, stderr);
		fputs(": ", stderr);

		va_start(ap, fmt);
		vfprintf(stderr, fmt, ap);
		va_end(ap);

		putc('\n', stderr);
	}

	fprintf(stderr, "Try '%s --help' for more information.\n",
		argv0);
	exit(EX_USAGE);
}

static void
HandleEnv(CommandLine &cmdline, const char *argv0, const char *p)
{
	const char *eq = strchr(p, '=');
	if (eq == nullptr || eq == p)
		arg_error(argv0, "Invalid environment variable (NAME=VALUE expected): %s", p);

	cmdline.env.push_back(p);
}

void
ParseCommandLine(CommandLine &cmdline, int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"version", 0, nullptr, 'V'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{"jail", 1, nullptr, 'j'},
		{"chdir", 1, nullptr, 'd'},
		{"env", 1, nullptr, 'e'},
		{"kill-timeout", 1, nullptr, 't'},
		{nullptr, 0, nullptr, 0}
	};

	unsigned verbose = 1;
	char *endptr;

	while (true) {
		int option_index = 0;

		/* '+': stop at the first non-option argument, which is
		   the program to be executed */
		int ret = getopt_long(argc, argv, "+hVvqj:d:e:t:",
				      long_options, &option_index);
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(EXIT_SUCCESS);

		case 'V':
			printf("jail-spawn v%s\n", VERSION);
			exit(EXIT_SUCCESS);

		case 'v':
			++verbose;
			break;

		case 'q':
			verbose = 0;
			break;

		case 'j':
			if (*optarg == 0)
				arg_error(argv[0], "Empty jail name");
			cmdline.jails.push_back(optarg);
			break;

		case 'd':
			cmdline.chdir = optarg;
			break;

		case 'e':
			HandleEnv(cmdline, argv[0], optarg);
			break;

		case 't': {
			const unsigned long value = strtoul(optarg, &endptr, 10);
			if (endptr == optarg || *endptr != 0 || value > 3600)
				arg_error(argv[0], "Invalid kill timeout: %s", optarg);

			cmdline.kill_timeout = std::chrono::seconds(value);
			break;
		}

		case '?':
			arg_error(argv[0], nullptr);

		default:
			exit(EXIT_FAILURE);
		}
	}

	SetLogLevel(verbose);

	/* check non-option arguments */

	if (cmdline.jails.empty())
		arg_error(argv[0], "No jail specified");

	if (optind >= argc)
		arg_error(argv[0], "No program specified");

	cmdline.program = {argv + optind, std::size_t(argc - optind)};
}
