// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Parse command line options.
 */

#pragma once

struct ChunkCatConfig;

struct ChunkCatCmdLine {
	/**
	 * The file to be streamed.
	 */
	const char *path = nullptr;
};

void
ParseCommandLine(ChunkCatCmdLine &cmdline, ChunkCatConfig &config,
		 int argc, char **argv);
