// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <cstdint>

struct ChunkOffset {
	/**
	 * The number of chunks the object spans.
	 */
	uint64_t total_chunks;

	/**
	 * The index of the first chunk to be read.
	 */
	uint64_t first_chunk;

	/**
	 * The number of leading bytes of the first chunk to be
	 * discarded.
	 */
	std::size_t skip;
};

/**
 * Figure out where reading a chunked object starts.
 *
 * Throws std::invalid_argument if the start position does not lie
 * within the given chunk, or if the chunk size is zero.
 *
 * @param length the total length of the object in bytes
 * @param chunk_index the index of the chunk which is loaded
 * @param position the absolute start position in bytes
 */
ChunkOffset
ResolveChunkOffset(uint64_t length, std::size_t chunk_size,
		   uint64_t chunk_index, uint64_t position);
