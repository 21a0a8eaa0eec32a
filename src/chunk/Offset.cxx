// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Offset.hxx"

#include <fmt/format.h>

#include <stdexcept>

ChunkOffset
ResolveChunkOffset(uint64_t length, std::size_t chunk_size,
		   uint64_t chunk_index, uint64_t position)
{
	if (chunk_size == 0)
		throw std::invalid_argument("Chunk size is zero");

	if (position > length)
		throw std::invalid_argument(fmt::format("Start position {} is beyond the end of the object ({} bytes)",
							position, length));

	if (chunk_index > length / chunk_size)
		throw std::invalid_argument(fmt::format("Loaded chunk {} is beyond the end of the object ({} bytes)",
							chunk_index, length));

	const uint64_t chunk_start = chunk_index * chunk_size;
	if (position < chunk_start || position - chunk_start >= chunk_size)
		throw std::invalid_argument(fmt::format("Start position {} is not inside the loaded chunk {}",
							position, chunk_index));

	return {
		.total_chunks = (length + chunk_size - 1) / chunk_size,
		.first_chunk = chunk_index,
		.skip = static_cast<std::size_t>(position - chunk_start),
	};
}
