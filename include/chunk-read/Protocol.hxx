// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Definitions shared between the chunk-read engine and the storage
 * backends implementing a chunked file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ChunkRead {

/**
 * The mode the underlying resource of a chunked file was opened in.
 * Only resources opened for writing need to be finalized when a
 * reader is done with them.
 */
enum class OpenMode : uint8_t {
	READ,
	WRITE,
};

/**
 * The metadata document a storage backend reports after a chunked
 * file has been finalized.  A backend whose finalization failed may
 * report a partially filled instance.
 */
struct FileMetadata {
	/**
	 * The backend-specific identifier of the file.
	 */
	std::string id;

	std::string filename;

	uint64_t length = 0;

	uint32_t chunk_size = 0;

	std::chrono::system_clock::time_point upload_date;
};

} // namespace ChunkRead
