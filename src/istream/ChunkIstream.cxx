// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ChunkIstream.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <cassert>
#include <stdexcept>

ChunkIstream::ChunkIstream(EventLoop &event_loop, ChunkedFile &_file,
			   ChunkIstreamHandler &_handler, bool _autoclose)
	:ChunkIstream(event_loop, _file, _handler, _autoclose,
		      ResolveChunkOffset(_file.GetLength(),
					 _file.GetChunkSize(),
					 _file.GetCurrentChunk().GetIndex(),
					 _file.GetPosition()))
{
}

ChunkIstream::ChunkIstream(EventLoop &event_loop, ChunkedFile &_file,
			   ChunkIstreamHandler &_handler, bool _autoclose,
			   const ChunkOffset &offset) noexcept
	:logger("chunk_istream"),
	 file(_file), handler(_handler),
	 defer_read(event_loop, BIND_THIS_METHOD(OnDeferredRead)),
	 total_chunks(offset.total_chunks),
	 current_chunk_index(offset.first_chunk),
	 pending_skip(offset.skip),
	 autoclose(_autoclose)
{
}

ChunkIstream::~ChunkIstream() noexcept
{
	if (fetching && fetch_cancel_ptr)
		fetch_cancel_ptr.Cancel();

	if (closing && close_cancel_ptr)
		close_cancel_ptr.Cancel();
}

void
ChunkIstream::Read() noexcept
{
	if (state != State::ACTIVE)
		return;

	if (current_chunk_index > total_chunks)
		return;

	want_read = true;

	if (paused || fetching || in_data)
		/* will be continued by Resume(), OnChunkFetched() or
		   SubmitPending() */
		return;

	defer_read.Cancel();
	TryRead();
}

void
ChunkIstream::Pause() noexcept
{
	paused = true;
	defer_read.Cancel();
}

void
ChunkIstream::Resume() noexcept
{
	if (state != State::ACTIVE || !paused)
		return;

	paused = false;

	if (!fetching)
		defer_read.Schedule();
}

void
ChunkIstream::Cancel(std::exception_ptr error) noexcept
{
	if (state != State::ACTIVE)
		return;

	state = State::DESTROYED;
	Pause();
	Shutdown(std::move(error));
}

inline void
ChunkIstream::TryRead() noexcept
{
	assert(state == State::ACTIVE);
	assert(!paused);
	assert(!fetching);

	if (!pending.empty() || IsEndReached())
		SubmitPending();
	else if (want_read)
		ProduceNextUnit();
}

void
ChunkIstream::OnDeferredRead() noexcept
{
	if (state != State::ACTIVE || paused || fetching)
		return;

	TryRead();
}

ChunkIstream::AdvanceResult
ChunkIstream::AdvanceIfNeeded() noexcept
{
	if (state != State::ACTIVE)
		return AdvanceResult::CLOSED;

	if (last_read_chunk_index != current_chunk_index)
		return AdvanceResult::NONE_NEEDED;

	if (fetching)
		return AdvanceResult::PENDING;

	++current_chunk_index;
	fetching = true;

	logger(6, "fetching chunk ",
	       fmt::format_int(current_chunk_index).c_str(),
	       " of ", fmt::format_int(total_chunks).c_str());

	/* the fetch may complete (and even shut down this object)
	   before FetchChunk() returns; don't touch any fields after
	   this call */
	file.FetchChunk(current_chunk_index, *this, fetch_cancel_ptr);
	return AdvanceResult::PENDING;
}

inline void
ChunkIstream::ProduceNextUnit() noexcept
{
	switch (AdvanceIfNeeded()) {
	case AdvanceResult::NONE_NEEDED:
		ConsumeChunk();
		break;

	case AdvanceResult::PENDING:
	case AdvanceResult::CLOSED:
		break;
	}
}

void
ChunkIstream::ConsumeChunk() noexcept
{
	assert(state == State::ACTIVE);
	assert(pending.empty());

	auto &chunk = file.GetCurrentChunk();

	if (pending_skip > 0) {
		chunk.SkipTo(pending_skip);
		pending_skip = 0;
	}

	pending = chunk.ReadSlice(chunk.GetAvailable());
	last_read_chunk_index = current_chunk_index;

	SubmitPending();
}

void
ChunkIstream::SubmitPending() noexcept
{
	assert(state == State::ACTIVE);

	if (paused)
		return;

	if (!pending.empty()) {
		want_read = false;

		const DestructObserver destructed(*this);
		in_data = true;
		const std::size_t nbytes = handler.OnData(pending);
		if (destructed)
			return;

		in_data = false;

		if (state != State::ACTIVE)
			return;

		assert(nbytes <= pending.size());
		pending = pending.subspan(nbytes);
		if (!pending.empty()) {
			/* the handler is blocking; offer the rest again
			   only if it has asked for more */
			if (want_read)
				defer_read.Schedule();
			return;
		}
	}

	if (IsEndReached())
		Shutdown({});
	else if (want_read)
		/* either the unit was empty or the handler asked for
		   more from inside OnData() */
		defer_read.Schedule();
}

void
ChunkIstream::Shutdown(std::exception_ptr error) noexcept
{
	if (state == State::CLOSED)
		return;

	state = State::CLOSED;
	defer_read.Cancel();
	pending = {};

	if (fetching) {
		/* the result of this fetch is of no interest anymore */
		fetching = false;
		if (fetch_cancel_ptr)
			fetch_cancel_ptr.Cancel();
	}

	if (error)
		handler.OnError(std::move(error));

	handler.OnEof();

	if (autoclose && file.GetOpenMode() == ChunkRead::OpenMode::WRITE) {
		closing = true;
		file.CloseResource(*this, close_cancel_ptr);
		return;
	}

	handler.OnChunkIstreamClose(nullptr);
}

void
ChunkIstream::OnChunkFetched(Chunk &&chunk) noexcept
{
	fetch_cancel_ptr = nullptr;

	if (state != State::ACTIVE) {
		/* a late result after Cancel() */
		logger(6, "discarding chunk ",
		       fmt::format_int(chunk.GetIndex()).c_str());
		return;
	}

	assert(fetching);
	fetching = false;

	if (chunk.GetIndex() != current_chunk_index) {
		Shutdown(std::make_exception_ptr(std::runtime_error(fmt::format("Storage returned chunk {} instead of {}",
										chunk.GetIndex(),
										current_chunk_index))));
		return;
	}

	file.SetCurrentChunk(std::move(chunk));

	/* if paused, the unit stays in #pending until Resume() */
	ConsumeChunk();
}

void
ChunkIstream::OnChunkFetchError(std::exception_ptr error) noexcept
{
	fetch_cancel_ptr = nullptr;

	if (state != State::ACTIVE)
		return;

	assert(fetching);
	fetching = false;

	logger(3, "failed to fetch chunk: ", error);

	Shutdown(NestException(std::move(error),
			       std::runtime_error(fmt::format("Failed to fetch chunk {}",
							      current_chunk_index))));
}

void
ChunkIstream::OnChunkedFileClosed(const ChunkRead::FileMetadata *metadata) noexcept
{
	assert(closing);

	closing = false;
	close_cancel_ptr = nullptr;

	handler.OnChunkIstreamClose(metadata);
}

void
ChunkIstream::OnChunkedFileCloseError(std::exception_ptr error,
				      const ChunkRead::FileMetadata *metadata) noexcept
{
	assert(closing);

	closing = false;
	close_cancel_ptr = nullptr;

	logger(3, "failed to close file: ", error);

	handler.OnError(std::move(error));
	handler.OnChunkIstreamClose(metadata);
}
