// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Handler.hxx"
#include "chunk/File.hxx"
#include "chunk/Offset.hxx"
#include "event/DeferEvent.hxx"
#include "io/Logger.hxx"
#include "util/Cancellable.hxx"
#include "util/DestructObserver.hxx"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <span>

/**
 * Receives the data and the lifecycle signals of a #ChunkIstream.
 *
 * Unlike a plain #IstreamHandler, OnEof() and OnError() are not the
 * last calls: an error is always followed by OnEof(), and every
 * session ends with exactly one OnChunkIstreamClose() call.  The
 * #ChunkIstream may be destroyed from within OnData() and
 * OnChunkIstreamClose(), but not from within OnEof() or OnError().
 */
class ChunkIstreamHandler : public IstreamHandler {
public:
	/**
	 * The stream will not access its #ChunkedFile anymore; if
	 * "autoclose" was enabled, the underlying resource has been
	 * finalized.
	 *
	 * @param metadata the document reported by the backend when
	 * finalizing the resource; nullptr if there was none
	 */
	virtual void OnChunkIstreamClose(const ChunkRead::FileMetadata *metadata) noexcept = 0;
};

/**
 * Reads a #ChunkedFile sequentially, one chunk per pull request,
 * starting at the position the #ChunkedFile was opened at.
 *
 * The consumer pulls with Read(); each call produces at most one
 * unit (the unread part of one chunk), which is passed to
 * IstreamHandler::OnData().  If the handler accepts only part of it,
 * the rest is offered again on the next Read().  At most one chunk
 * fetch is in flight at any time.
 *
 * After the final chunk has been consumed (or after an error or
 * Cancel()), the stream shuts down: it stops producing data, reports
 * the error (if any), end-of-file and finally "close".
 */
class ChunkIstream final
	: ChunkFetchHandler, ChunkedFileCloseHandler, DestructAnchor {

	enum class State : uint8_t {
		ACTIVE,

		/**
		 * Cancel() has been called and the shutdown is in
		 * progress.
		 */
		DESTROYED,

		/**
		 * No more data will be produced.  This state is
		 * terminal.
		 */
		CLOSED,
	};

	enum class AdvanceResult : uint8_t {
		/**
		 * The loaded chunk still has unread data.
		 */
		NONE_NEEDED,

		/**
		 * A fetch has been started; the result will be
		 * delivered to OnChunkFetched() or
		 * OnChunkFetchError().
		 */
		PENDING,

		/**
		 * The stream is not active anymore.
		 */
		CLOSED,
	};

	static constexpr uint64_t NOTHING_READ = std::numeric_limits<uint64_t>::max();

	const LLogger logger;

	ChunkedFile &file;

	ChunkIstreamHandler &handler;

	/**
	 * Continues a pull request from a new stack frame.
	 */
	DeferEvent defer_read;

	CancellablePointer fetch_cancel_ptr, close_cancel_ptr;

	/**
	 * The part of the current unit which has not been accepted by
	 * the handler yet.  It points into the current chunk of
	 * #file.
	 */
	std::span<const std::byte> pending;

	const uint64_t total_chunks;

	uint64_t current_chunk_index;

	/**
	 * The number of leading bytes of the first chunk to be
	 * discarded.  Reset to 0 after the first chunk has been
	 * consumed.
	 */
	std::size_t pending_skip;

	/**
	 * The index of the chunk which has been extracted most
	 * recently, or #NOTHING_READ.
	 */
	uint64_t last_read_chunk_index = NOTHING_READ;

	State state = State::ACTIVE;

	/**
	 * Is a FetchChunk() call in flight?
	 */
	bool fetching = false;

	/**
	 * Is a CloseResource() call in flight?
	 */
	bool closing = false;

	bool paused = false;

	/**
	 * Has the handler requested data which has not been delivered
	 * yet?
	 */
	bool want_read = false;

	/**
	 * Are we currently inside IstreamHandler::OnData()?
	 */
	bool in_data = false;

	const bool autoclose;

public:
	/**
	 * Throws std::invalid_argument if the start position of the
	 * #ChunkedFile is inconsistent with its loaded chunk.
	 *
	 * @param autoclose finalize the underlying resource of write-mode
	 * files on shutdown
	 */
	ChunkIstream(EventLoop &event_loop, ChunkedFile &_file,
		     ChunkIstreamHandler &_handler, bool _autoclose=false);

	~ChunkIstream() noexcept;

	ChunkIstream(const ChunkIstream &) = delete;
	ChunkIstream &operator=(const ChunkIstream &) = delete;

	uint64_t GetTotalChunks() const noexcept {
		return total_chunks;
	}

	uint64_t GetCurrentChunkIndex() const noexcept {
		return current_chunk_index;
	}

	std::size_t GetPendingSkip() const noexcept {
		return pending_skip;
	}

	bool IsClosed() const noexcept {
		return state == State::CLOSED;
	}

	bool IsPaused() const noexcept {
		return paused;
	}

	/**
	 * Request the next unit of data.  It is delivered either from
	 * within this call or later, after the next chunk has been
	 * fetched.
	 */
	void Read() noexcept;

	/**
	 * Stop delivering data until Resume() is called.
	 */
	void Pause() noexcept;

	void Resume() noexcept;

	/**
	 * Stop the stream now.  The error (if any) is reported to the
	 * handler, followed by end-of-file and "close".  Calling this
	 * on a stream which is already closed has no effect.
	 */
	void Cancel(std::exception_ptr error={}) noexcept;

private:
	ChunkIstream(EventLoop &event_loop, ChunkedFile &_file,
		     ChunkIstreamHandler &_handler, bool _autoclose,
		     const ChunkOffset &offset) noexcept;

	bool IsEndReached() const noexcept {
		return last_read_chunk_index != NOTHING_READ &&
			last_read_chunk_index + 1 >= total_chunks;
	}

	void TryRead() noexcept;
	void OnDeferredRead() noexcept;

	AdvanceResult AdvanceIfNeeded() noexcept;
	void ProduceNextUnit() noexcept;

	/**
	 * Extract the next unit from the loaded chunk into #pending
	 * and submit it.
	 */
	void ConsumeChunk() noexcept;

	/**
	 * Submit #pending to the handler; shut down if the end has been
	 * reached.
	 */
	void SubmitPending() noexcept;

	void Shutdown(std::exception_ptr error) noexcept;

	/* virtual methods from class ChunkFetchHandler */
	void OnChunkFetched(Chunk &&chunk) noexcept override;
	void OnChunkFetchError(std::exception_ptr error) noexcept override;

	/* virtual methods from class ChunkedFileCloseHandler */
	void OnChunkedFileClosed(const ChunkRead::FileMetadata *metadata) noexcept override;
	void OnChunkedFileCloseError(std::exception_ptr error,
				     const ChunkRead::FileMetadata *metadata) noexcept override;
};
