// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Config.hxx"
#include "io/Logger.hxx"

#include <fmt/core.h>

#include <stdexcept>
#include <string_view>

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

static void
PrintUsage()
{
	puts("usage: cm4all-chunk-cat [options] PATH\n\n"
	     "valid options:\n"
	     " -h, --help              help (this text)\n"
	     " -V, --version           show cm4all-chunk-cat version\n"
	     " -v, --verbose           be more verbose\n"
	     " -q, --quiet             be quiet\n"
	     " -c, --chunk-size SIZE   split the file into chunks of this size\n"
	     " -p, --position OFFSET   start reading at this byte offset\n"
	     " -d, --delay MS          delay each chunk fetch\n"
	     " -w, --write             open the file in write mode\n"
	     " -n, --no-autoclose      don't finalize the file at the end\n"
	     " -s, --set NAME=VALUE    tweak a setting, see manual for details\n"
	     );
}

[[noreturn]]
static void
arg_error(const char *argv0)
{
	fmt::print(stderr, "Try '{} --help' for more information.\n", argv0);
	exit(1);
}

template<typename... Args>
[[noreturn]]
static void
arg_error(const char *argv0, fmt::format_string<Args...> format_str,
	  Args&&... args)
{
	fmt::print(stderr, "{}: {}\n", argv0,
		   fmt::format(format_str, std::forward<Args>(args)...));
	arg_error(argv0);
}

static void
HandleSet(ChunkCatConfig &config, const char *argv0, const char *p)
{
	const char *eq = strchr(p, '=');
	if (eq == nullptr)
		arg_error(argv0, "No '=' found in --set argument");

	if (eq == p)
		arg_error(argv0, "No name found in --set argument");

	const std::string_view name(p, eq - p);
	const char *const value = eq + 1;

	try {
		config.HandleSet(name, value);
	} catch (const std::runtime_error &e) {
		arg_error(argv0, "Error while parsing \"--set {}\": {}",
			  name, e.what());
	}
}

void
ParseCommandLine(ChunkCatCmdLine &cmdline, ChunkCatConfig &config,
		 int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"version", 0, nullptr, 'V'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{"chunk-size", 1, nullptr, 'c'},
		{"position", 1, nullptr, 'p'},
		{"delay", 1, nullptr, 'd'},
		{"write", 0, nullptr, 'w'},
		{"no-autoclose", 0, nullptr, 'n'},
		{"set", 1, nullptr, 's'},
		{nullptr, 0, nullptr, 0}
	};

	unsigned verbose = 1;

	while (true) {
		int option_index = 0;
		const int ret = getopt_long(argc, argv, "hVvqc:p:d:wns:",
					    long_options, &option_index);
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(0);

		case 'V':
			printf("cm4all-chunk-cat v%s\n", CHUNK_READ_VERSION);
			exit(0);

		case 'v':
			++verbose;
			break;

		case 'q':
			verbose = 0;
			break;

		case 'c':
			HandleSet(config, argv[0],
				  fmt::format("chunk_size={}", optarg).c_str());
			break;

		case 'p':
			HandleSet(config, argv[0],
				  fmt::format("position={}", optarg).c_str());
			break;

		case 'd':
			HandleSet(config, argv[0],
				  fmt::format("fetch_delay_ms={}", optarg).c_str());
			break;

		case 'w':
			config.write_mode = true;
			break;

		case 'n':
			config.autoclose = false;
			break;

		case 's':
			HandleSet(config, argv[0], optarg);
			break;

		case '?':
			arg_error(argv[0]);

		default:
			exit(1);
		}
	}

	SetLogLevel(verbose);

	/* check non-option arguments */

	if (optind >= argc)
		arg_error(argv[0], "No file specified");

	cmdline.path = argv[optind++];

	if (optind < argc)
		arg_error(argv[0], "unrecognized argument: {}", argv[optind]);
}
