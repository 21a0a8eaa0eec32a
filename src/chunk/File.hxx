// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Chunk.hxx"

#include <chunk-read/Protocol.hxx>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <utility>

class CancellablePointer;

class ChunkFetchHandler {
public:
	/**
	 * The requested chunk has been fetched.
	 */
	virtual void OnChunkFetched(Chunk &&chunk) noexcept = 0;

	virtual void OnChunkFetchError(std::exception_ptr error) noexcept = 0;
};

class ChunkedFileCloseHandler {
public:
	/**
	 * The resource has been finalized.
	 *
	 * @param metadata the metadata document reported by the
	 * backend; nullptr if it has none
	 */
	virtual void OnChunkedFileClosed(const ChunkRead::FileMetadata *metadata) noexcept = 0;

	/**
	 * Finalizing the resource has failed.
	 *
	 * @param metadata whatever the backend was able to report
	 * despite the failure; may be nullptr
	 */
	virtual void OnChunkedFileCloseError(std::exception_ptr error,
					     const ChunkRead::FileMetadata *metadata) noexcept = 0;
};

/**
 * A large object stored as a sequence of fixed-size chunks in some
 * storage backend.  One chunk is "loaded" at any time; the reader
 * consumes it and asks the backend for the next one.
 *
 * An instance must not be used by more than one reader at a time.
 */
class ChunkedFile {
	const uint64_t length;

	const std::size_t chunk_size;

	/**
	 * The absolute byte offset the reader shall start at.
	 */
	const uint64_t position;

	const ChunkRead::OpenMode mode;

protected:
	Chunk current_chunk;

	ChunkedFile(uint64_t _length, std::size_t _chunk_size,
		    uint64_t _position, ChunkRead::OpenMode _mode) noexcept
		:length(_length), chunk_size(_chunk_size),
		 position(_position), mode(_mode) {}

public:
	virtual ~ChunkedFile() noexcept = default;

	ChunkedFile(const ChunkedFile &) = delete;
	ChunkedFile &operator=(const ChunkedFile &) = delete;

	uint64_t GetLength() const noexcept {
		return length;
	}

	std::size_t GetChunkSize() const noexcept {
		return chunk_size;
	}

	uint64_t GetPosition() const noexcept {
		return position;
	}

	ChunkRead::OpenMode GetOpenMode() const noexcept {
		return mode;
	}

	Chunk &GetCurrentChunk() noexcept {
		return current_chunk;
	}

	const Chunk &GetCurrentChunk() const noexcept {
		return current_chunk;
	}

	void SetCurrentChunk(Chunk &&chunk) noexcept {
		current_chunk = std::move(chunk);
	}

	/**
	 * Fetch the chunk with the given index asynchronously.  The
	 * result is passed to the handler; it does not replace the
	 * current chunk.
	 */
	virtual void FetchChunk(uint64_t index, ChunkFetchHandler &handler,
				CancellablePointer &cancel_ptr) noexcept = 0;

	/**
	 * Finalize and release the underlying resource asynchronously.
	 */
	virtual void CloseResource(ChunkedFileCloseHandler &handler,
				   CancellablePointer &cancel_ptr) noexcept = 0;
};
