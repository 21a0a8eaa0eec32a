// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MemoryChunkedFile.hxx"
#include "RecordingChunkIstreamHandler.hxx"
#include "istream/ChunkIstream.hxx"
#include "event/Loop.hxx"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using Events = std::vector<std::string>;
using Sizes = std::vector<std::size_t>;

static constexpr char ten_bytes[] = "0123456789";

TEST(ChunkIstream, WholeObject)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4);
	RecordingChunkIstreamHandler handler;
	ChunkIstream istream(event_loop, file, handler);
	handler.istream = &istream;

	EXPECT_EQ(istream.GetTotalChunks(), 3u);
	EXPECT_EQ(istream.GetCurrentChunkIndex(), 0u);
	EXPECT_EQ(istream.GetPendingSkip(), 0u);

	/* the first chunk is loaded already */
	istream.Read();
	EXPECT_EQ(handler.events, (Events{"data 4"}));
	EXPECT_TRUE(file.fetched.empty());

	istream.Read();
	EXPECT_TRUE(file.IsFetchPending());
	EXPECT_EQ(handler.events.size(), 1u);

	event_loop.Dispatch();
	EXPECT_EQ(handler.events, (Events{"data 4", "data 4"}));

	istream.Read();
	event_loop.Dispatch();

	EXPECT_EQ(handler.events,
		  (Events{"data 4", "data 4", "data 2", "eof", "close"}));
	EXPECT_EQ(handler.data, ten_bytes);
	EXPECT_EQ(file.fetched, (std::vector<uint64_t>{1, 2}));
	EXPECT_EQ(file.n_closes, 0u);
	EXPECT_TRUE(istream.IsClosed());
	EXPECT_FALSE(handler.metadata);
}

TEST(ChunkIstream, StartInsideChunk)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4, 5);
	RecordingChunkIstreamHandler handler;
	ChunkIstream istream(event_loop, file, handler);
	handler.istream = &istream;

	EXPECT_EQ(istream.GetTotalChunks(), 3u);
	EXPECT_EQ(istream.GetCurrentChunkIndex(), 1u);
	EXPECT_EQ(istream.GetPendingSkip(), 1u);

	istream.Read();
	EXPECT_EQ(handler.data, "567");
	EXPECT_EQ(istream.GetPendingSkip(), 0u);

	istream.Read();
	event_loop.Dispatch();

	EXPECT_EQ(handler.offered, (Sizes{3, 2}));
	EXPECT_EQ(handler.data, "56789");
	EXPECT_EQ(handler.events,
		  (Events{"data 3", "data 2", "eof", "close"}));
	EXPECT_EQ(file.fetched, (std::vector<uint64_t>{2}));
}

TEST(ChunkIstream, AutocloseWrite)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4, 0,
			       ChunkRead::OpenMode::WRITE);
	RecordingChunkIstreamHandler handler;
	handler.read_in_data = true;
	ChunkIstream istream(event_loop, file, handler, true);
	handler.istream = &istream;

	istream.Read();
	event_loop.Dispatch();

	EXPECT_EQ(handler.events,
		  (Events{"data 4", "data 4", "data 2", "eof", "close memory.bin"}));
	EXPECT_EQ(file.n_closes, 1u);
	ASSERT_TRUE(handler.metadata);
	EXPECT_EQ(handler.metadata->id, "memory");
	EXPECT_EQ(handler.metadata->length, 10u);
	EXPECT_EQ(handler.metadata->chunk_size, 4u);
}

TEST(ChunkIstream, AutocloseRead)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4);
	RecordingChunkIstreamHandler handler;
	handler.read_in_data = true;
	ChunkIstream istream(event_loop, file, handler, true);
	handler.istream = &istream;

	istream.Read();
	event_loop.Dispatch();

	/* read-mode resources are never finalized */
	EXPECT_EQ(handler.events,
		  (Events{"data 4", "data 4", "data 2", "eof", "close"}));
	EXPECT_EQ(file.n_closes, 0u);
}

TEST(ChunkIstream, CloseError)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4, 0,
			       ChunkRead::OpenMode::WRITE);
	file.fail_close = true;
	RecordingChunkIstreamHandler handler;
	handler.read_in_data = true;
	ChunkIstream istream(event_loop, file, handler, true);
	handler.istream = &istream;

	istream.Read();
	event_loop.Dispatch();

	EXPECT_EQ(handler.events,
		  (Events{"data 4", "data 4", "data 2", "eof",
			  "error Commit failed", "close memory.bin"}));
	EXPECT_EQ(file.n_closes, 1u);

	/* the partial metadata is passed along */
	ASSERT_TRUE(handler.metadata);
	EXPECT_EQ(handler.metadata->filename, "memory.bin");
	EXPECT_EQ(handler.metadata->length, 0u);
}

TEST(ChunkIstream, CancelWhileFetching)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4);
	file.ignore_cancel = true;
	RecordingChunkIstreamHandler handler;
	ChunkIstream istream(event_loop, file, handler);
	handler.istream = &istream;

	istream.Read();
	istream.Read();
	ASSERT_TRUE(file.IsFetchPending());

	istream.Cancel(std::make_exception_ptr(std::runtime_error("Aborted")));
	EXPECT_EQ(handler.events,
		  (Events{"data 4", "error Aborted", "eof", "close"}));
	EXPECT_EQ(file.n_fetch_cancels, 1u);

	/* the backend delivers the chunk anyway; it is discarded */
	event_loop.Dispatch();
	EXPECT_FALSE(file.IsFetchPending());

	istream.Read();
	event_loop.Dispatch();

	EXPECT_EQ(handler.events,
		  (Events{"data 4", "error Aborted", "eof", "close"}));
	EXPECT_EQ(handler.data, "0123");
	EXPECT_EQ(file.fetched, (std::vector<uint64_t>{1}));
}

TEST(ChunkIstream, CancelAbortsFetch)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4);
	RecordingChunkIstreamHandler handler;
	ChunkIstream istream(event_loop, file, handler);
	handler.istream = &istream;

	istream.Read();
	istream.Read();
	ASSERT_TRUE(file.IsFetchPending());

	istream.Cancel();
	EXPECT_FALSE(file.IsFetchPending());
	EXPECT_EQ(file.n_fetch_cancels, 1u);

	event_loop.Dispatch();
	EXPECT_EQ(handler.events, (Events{"data 4", "eof", "close"}));
}

TEST(ChunkIstream, CancelTwice)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4, 0,
			       ChunkRead::OpenMode::WRITE);
	RecordingChunkIstreamHandler handler;
	ChunkIstream istream(event_loop, file, handler, true);
	handler.istream = &istream;

	istream.Cancel(std::make_exception_ptr(std::runtime_error("First")));
	istream.Cancel(std::make_exception_ptr(std::runtime_error("Second")));
	event_loop.Dispatch();
	istream.Cancel(std::make_exception_ptr(std::runtime_error("Third")));
	event_loop.Dispatch();

	EXPECT_EQ(handler.events,
		  (Events{"error First", "eof", "close memory.bin"}));
	EXPECT_EQ(file.n_closes, 1u);
	EXPECT_TRUE(file.fetched.empty());
}

TEST(ChunkIstream, CancelAfterEnd)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4);
	RecordingChunkIstreamHandler handler;
	handler.read_in_data = true;
	ChunkIstream istream(event_loop, file, handler);
	handler.istream = &istream;

	istream.Read();
	event_loop.Dispatch();
	ASSERT_TRUE(handler.IsClosed());

	const auto events = handler.events;

	istream.Cancel(std::make_exception_ptr(std::runtime_error("Too late")));
	istream.Read();
	istream.Resume();
	event_loop.Dispatch();

	EXPECT_EQ(handler.events, events);
}

TEST(ChunkIstream, FetchError)
{
	for (uint64_t i = 1; i < 3; ++i) {
		EventLoop event_loop;
		MemoryChunkedFile file(event_loop, ten_bytes, 4);
		file.fail_fetch_index = i;
		RecordingChunkIstreamHandler handler;
		handler.read_in_data = true;
		ChunkIstream istream(event_loop, file, handler);
		handler.istream = &istream;

		istream.Read();
		event_loop.Dispatch();

		Events expected;
		for (uint64_t j = 0; j < i; ++j)
			expected.emplace_back("data 4");
		expected.push_back(fmt::format("error Failed to fetch chunk {}; I/O error on chunk {}",
					       i, i));
		expected.emplace_back("eof");
		expected.emplace_back("close");

		EXPECT_EQ(handler.events, expected);
		EXPECT_EQ(handler.data.size(), i * 4);

		/* no retry */
		EXPECT_EQ(file.fetched.size(), i);
	}
}

TEST(ChunkIstream, WrongChunk)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4);
	file.deliver_wrong_index = true;
	RecordingChunkIstreamHandler handler;
	handler.read_in_data = true;
	ChunkIstream istream(event_loop, file, handler);
	handler.istream = &istream;

	istream.Read();
	event_loop.Dispatch();

	EXPECT_EQ(handler.events,
		  (Events{"data 4", "error Storage returned chunk 2 instead of 1",
			  "eof", "close"}));
}

TEST(ChunkIstream, SingleFetch)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4);
	file.hold_fetch = true;
	RecordingChunkIstreamHandler handler;
	ChunkIstream istream(event_loop, file, handler);
	handler.istream = &istream;

	istream.Read();
	istream.Read();
	istream.Read();
	istream.Read();
	event_loop.Dispatch();

	EXPECT_EQ(file.fetched, (std::vector<uint64_t>{1}));
	EXPECT_EQ(istream.GetCurrentChunkIndex(), 1u);

	file.CompleteFetch();
	EXPECT_EQ(handler.events, (Events{"data 4", "data 4"}));
}

TEST(ChunkIstream, PartialConsumption)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4);
	RecordingChunkIstreamHandler handler;
	handler.accept_max = 3;
	ChunkIstream istream(event_loop, file, handler);
	handler.istream = &istream;

	istream.Read();
	EXPECT_EQ(handler.data, "012");

	/* the rest of the unit is offered again before the next chunk
	   is fetched */
	istream.Read();
	EXPECT_EQ(handler.data, "0123");
	EXPECT_TRUE(file.fetched.empty());

	handler.read_in_data = true;
	istream.Read();
	event_loop.Dispatch();

	EXPECT_EQ(handler.offered, (Sizes{4, 1, 4, 1, 2}));
	EXPECT_EQ(handler.data, ten_bytes);
	EXPECT_EQ(handler.events.back(), "close");
}

TEST(ChunkIstream, PauseResume)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4);
	RecordingChunkIstreamHandler handler;
	ChunkIstream istream(event_loop, file, handler);
	handler.istream = &istream;

	istream.Pause();
	EXPECT_TRUE(istream.IsPaused());

	istream.Read();
	event_loop.Dispatch();
	EXPECT_TRUE(handler.events.empty());

	/* the remembered request is continued from the event loop */
	istream.Resume();
	EXPECT_TRUE(handler.events.empty());
	event_loop.Dispatch();
	EXPECT_EQ(handler.events, (Events{"data 4"}));

	/* pause while fetching: the chunk is loaded but held back */
	istream.Read();
	istream.Pause();
	event_loop.Dispatch();
	EXPECT_EQ(file.fetched, (std::vector<uint64_t>{1}));
	EXPECT_EQ(handler.events, (Events{"data 4"}));

	istream.Resume();
	event_loop.Dispatch();
	EXPECT_EQ(handler.events, (Events{"data 4", "data 4"}));

	handler.read_in_data = true;
	istream.Read();
	event_loop.Dispatch();
	EXPECT_EQ(handler.data, ten_bytes);
	EXPECT_TRUE(handler.IsClosed());
}

TEST(ChunkIstream, CancelInData)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4);
	RecordingChunkIstreamHandler handler;
	handler.cancel_in_data = true;
	ChunkIstream istream(event_loop, file, handler);
	handler.istream = &istream;

	istream.Read();
	event_loop.Dispatch();

	EXPECT_EQ(handler.events, (Events{"data 4", "eof", "close"}));
	EXPECT_TRUE(file.fetched.empty());
}

TEST(ChunkIstream, DestroyInData)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4);
	RecordingChunkIstreamHandler handler;
	auto istream = std::make_unique<ChunkIstream>(event_loop, file, handler);
	handler.istream = istream.get();
	handler.owner = &istream;
	handler.destroy_in_data = true;

	istream->Read();
	EXPECT_FALSE(istream);

	event_loop.Dispatch();
	EXPECT_EQ(handler.events, (Events{"data 4"}));
	EXPECT_TRUE(file.fetched.empty());
}

TEST(ChunkIstream, DestroyOnClose)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4, 0,
			       ChunkRead::OpenMode::WRITE);
	RecordingChunkIstreamHandler handler;
	handler.read_in_data = true;
	auto istream = std::make_unique<ChunkIstream>(event_loop, file,
						      handler, true);
	handler.istream = istream.get();
	handler.owner = &istream;
	handler.destroy_on_close = true;

	istream->Read();
	event_loop.Dispatch();

	EXPECT_FALSE(istream);
	EXPECT_EQ(handler.data, ten_bytes);
	EXPECT_EQ(handler.events.back(), "close memory.bin");
}

TEST(ChunkIstream, DestroyWhileFetching)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4);
	RecordingChunkIstreamHandler handler;
	auto istream = std::make_unique<ChunkIstream>(event_loop, file, handler);
	handler.istream = istream.get();

	istream->Read();
	istream->Read();
	ASSERT_TRUE(file.IsFetchPending());

	istream.reset();
	EXPECT_FALSE(file.IsFetchPending());
	EXPECT_EQ(file.n_fetch_cancels, 1u);

	event_loop.Dispatch();
	EXPECT_EQ(handler.events, (Events{"data 4"}));
}

TEST(ChunkIstream, DestroyWhileClosing)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, ten_bytes, 4, 0,
			       ChunkRead::OpenMode::WRITE);
	RecordingChunkIstreamHandler handler;
	auto istream = std::make_unique<ChunkIstream>(event_loop, file,
						      handler, true);
	handler.istream = istream.get();

	istream->Cancel();
	EXPECT_EQ(file.n_closes, 1u);

	istream.reset();
	EXPECT_EQ(file.n_close_cancels, 1u);

	event_loop.Dispatch();
	EXPECT_EQ(handler.events, (Events{"eof"}));
}

TEST(ChunkIstream, EmptyObject)
{
	EventLoop event_loop;
	MemoryChunkedFile file(event_loop, "", 4);
	RecordingChunkIstreamHandler handler;
	ChunkIstream istream(event_loop, file, handler);
	handler.istream = &istream;

	EXPECT_EQ(istream.GetTotalChunks(), 0u);

	istream.Read();
	EXPECT_EQ(handler.events, (Events{"eof", "close"}));
	EXPECT_TRUE(file.fetched.empty());
}

TEST(ChunkIstream, StartAtEnd)
{
	{
		/* inside the last chunk */
		EventLoop event_loop;
		MemoryChunkedFile file(event_loop, ten_bytes, 4, 10);
		RecordingChunkIstreamHandler handler;
		ChunkIstream istream(event_loop, file, handler);
		handler.istream = &istream;

		EXPECT_EQ(istream.GetPendingSkip(), 2u);

		istream.Read();
		EXPECT_EQ(handler.events, (Events{"eof", "close"}));
		EXPECT_TRUE(file.fetched.empty());
	}

	{
		/* on a chunk boundary */
		EventLoop event_loop;
		MemoryChunkedFile file(event_loop, "01234567", 4, 8);
		RecordingChunkIstreamHandler handler;
		ChunkIstream istream(event_loop, file, handler);
		handler.istream = &istream;

		EXPECT_EQ(istream.GetTotalChunks(), 2u);
		EXPECT_EQ(istream.GetCurrentChunkIndex(), 2u);

		istream.Read();
		EXPECT_EQ(handler.events, (Events{"eof", "close"}));
		EXPECT_TRUE(file.fetched.empty());
	}
}

TEST(ChunkIstream, MalformedOffset)
{
	EventLoop event_loop;
	RecordingChunkIstreamHandler handler;

	{
		/* position 5 is not inside chunk 0 */
		MemoryChunkedFile file(event_loop, ten_bytes, 4, 5);
		file.LoadChunk(0);
		EXPECT_THROW(ChunkIstream istream(event_loop, file, handler),
			     std::invalid_argument);
	}

	{
		/* a huge chunk index must not wrap around to the start */
		MemoryChunkedFile file(event_loop, ten_bytes, 4);
		file.LoadChunk(uint64_t(1) << 62);
		EXPECT_THROW(ChunkIstream istream(event_loop, file, handler),
			     std::invalid_argument);
		EXPECT_TRUE(file.fetched.empty());
	}

	{
		MemoryChunkedFile file(event_loop, ten_bytes, 0);
		EXPECT_THROW(ChunkIstream istream(event_loop, file, handler),
			     std::invalid_argument);
	}

	EXPECT_TRUE(handler.events.empty());
}

/**
 * The concatenated output of a session is the object from the start
 * position to the end.
 */
TEST(ChunkIstream, Concatenation)
{
	const std::string contents = "abcdefghijklmnopqrstuvwxyz";

	for (std::size_t length = 0; length <= contents.size(); length += 5) {
		const std::string_view object(contents.data(), length);

		for (std::size_t chunk_size = 1; chunk_size <= 7; chunk_size += 3) {
			for (std::size_t position = 0; position <= length; ++position) {
				EventLoop event_loop;
				MemoryChunkedFile file(event_loop, object,
						       chunk_size, position);
				RecordingChunkIstreamHandler handler;
				handler.read_in_data = true;
				ChunkIstream istream(event_loop, file, handler);
				handler.istream = &istream;

				istream.Read();
				event_loop.Dispatch();

				EXPECT_EQ(handler.data, object.substr(position));
				EXPECT_TRUE(handler.IsClosed());
				EXPECT_EQ(handler.events.back(), "close");
			}
		}
	}
}
