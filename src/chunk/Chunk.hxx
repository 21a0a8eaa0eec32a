// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

/**
 * One chunk of a #ChunkedFile which has been loaded into memory,
 * together with a read position.
 */
class Chunk {
	uint64_t index = 0;

	std::vector<std::byte> data;

	/**
	 * The number of bytes at the beginning of #data which have
	 * already been consumed.
	 */
	std::size_t position = 0;

public:
	Chunk() = default;

	Chunk(uint64_t _index, std::vector<std::byte> &&_data) noexcept
		:index(_index), data(std::move(_data)) {}

	Chunk(Chunk &&) = default;
	Chunk &operator=(Chunk &&) = default;

	uint64_t GetIndex() const noexcept {
		return index;
	}

	std::size_t GetSize() const noexcept {
		return data.size();
	}

	std::size_t GetPosition() const noexcept {
		return position;
	}

	/**
	 * The number of bytes which have not been consumed yet.
	 */
	std::size_t GetAvailable() const noexcept {
		return data.size() - position;
	}

	/**
	 * Discard data up to the given offset.  Does nothing if that
	 * offset has already been consumed; clamps to the end of the
	 * chunk.
	 */
	void SkipTo(std::size_t offset) noexcept {
		position = std::max(position, std::min(offset, data.size()));
	}

	/**
	 * Consume the next #n bytes.  The returned span remains valid
	 * until this object is destroyed or replaced.
	 */
	std::span<const std::byte> ReadSlice(std::size_t n) noexcept {
		assert(n <= GetAvailable());

		const auto result = std::span<const std::byte>{data}.subspan(position, n);
		position += n;
		return result;
	}
};
