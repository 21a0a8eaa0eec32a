// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "File.hxx"
#include "event/TimerEvent.hxx"
#include "util/Cancellable.hxx"

#include <chrono>
#include <memory>
#include <string>

/**
 * A #ChunkedFile backed by a regular file on the local filesystem,
 * which is split into chunks of the configured size.  Chunks are read
 * with pread() and delivered after a configurable delay, to mimic the
 * latency of a remote store.
 */
class LocalChunkedFile final : public ChunkedFile {
	class Operation : public Cancellable {
	protected:
		LocalChunkedFile &file;

		TimerEvent timer;

	public:
		explicit Operation(LocalChunkedFile &_file) noexcept;

		void Cancel() noexcept override {
			timer.Cancel();
		}

		bool IsPending() const noexcept {
			return timer.IsPending();
		}

	protected:
		void Start() noexcept {
			timer.Schedule(file.delay);
		}

		virtual void OnTimer() noexcept = 0;
	};

	class FetchOperation final : public Operation {
		ChunkFetchHandler *handler;
		uint64_t index;

	public:
		using Operation::Operation;

		void Start(uint64_t _index, ChunkFetchHandler &_handler) noexcept {
			index = _index;
			handler = &_handler;
			Operation::Start();
		}

	private:
		void OnTimer() noexcept override;
	};

	class CloseOperation final : public Operation {
		ChunkedFileCloseHandler *handler;

	public:
		using Operation::Operation;

		void Start(ChunkedFileCloseHandler &_handler) noexcept {
			handler = &_handler;
			Operation::Start();
		}

	private:
		void OnTimer() noexcept override;
	};

	EventLoop &event_loop;

	const std::string path;

	int fd;

	const std::chrono::steady_clock::duration delay;

	FetchOperation fetch_operation;
	CloseOperation close_operation;

	LocalChunkedFile(EventLoop &event_loop, std::string &&_path, int _fd,
			 uint64_t _length, std::size_t _chunk_size,
			 uint64_t _position, ChunkRead::OpenMode _mode,
			 std::chrono::steady_clock::duration _delay) noexcept;

public:
	~LocalChunkedFile() noexcept;

	/**
	 * Open a file and load the chunk containing the start
	 * position.  Throws on error.
	 *
	 * @param delay the latency of each asynchronous operation
	 */
	static std::unique_ptr<LocalChunkedFile> Open(EventLoop &event_loop,
						      const char *path,
						      std::size_t chunk_size,
						      uint64_t position,
						      ChunkRead::OpenMode mode,
						      std::chrono::steady_clock::duration delay={});

	/* virtual methods from class ChunkedFile */
	void FetchChunk(uint64_t index, ChunkFetchHandler &handler,
			CancellablePointer &cancel_ptr) noexcept override;
	void CloseResource(ChunkedFileCloseHandler &handler,
			   CancellablePointer &cancel_ptr) noexcept override;

private:
	/**
	 * Read one chunk synchronously.  Throws on error.
	 */
	Chunk ReadChunk(uint64_t index) const;

	ChunkRead::FileMetadata MakeMetadata() const noexcept;

	/**
	 * Flush and close the file descriptor.  Throws on error.
	 */
	void Finalize();
};
