// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

/**
 * Configuration of the cm4all-chunk-cat program.
 */
struct ChunkCatConfig {
	std::size_t chunk_size = 256 * 1024;

	/**
	 * The absolute byte offset to start reading at.
	 */
	uint64_t position = 0;

	/**
	 * Simulated latency of each chunk fetch.
	 */
	std::chrono::milliseconds fetch_delay{0};

	bool autoclose = true;

	/**
	 * Open the file in write mode, which means it gets committed
	 * (fsync()) on "autoclose".
	 */
	bool write_mode = false;

	/**
	 * Handle a "--set NAME=VALUE" setting.  Throws
	 * std::runtime_error on error.
	 */
	void HandleSet(std::string_view name, const char *value);
};
