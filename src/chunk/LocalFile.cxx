// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LocalFile.hxx"
#include "system/Error.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

LocalChunkedFile::Operation::Operation(LocalChunkedFile &_file) noexcept
	:file(_file),
	 timer(_file.event_loop, BIND_THIS_METHOD(OnTimer))
{
}

LocalChunkedFile::LocalChunkedFile(EventLoop &_event_loop,
				   std::string &&_path, int _fd,
				   uint64_t _length, std::size_t _chunk_size,
				   uint64_t _position, ChunkRead::OpenMode _mode,
				   std::chrono::steady_clock::duration _delay) noexcept
	:ChunkedFile(_length, _chunk_size, _position, _mode),
	 event_loop(_event_loop),
	 path(std::move(_path)), fd(_fd), delay(_delay),
	 fetch_operation(*this), close_operation(*this)
{
}

LocalChunkedFile::~LocalChunkedFile() noexcept
{
	if (fd >= 0)
		close(fd);
}

std::unique_ptr<LocalChunkedFile>
LocalChunkedFile::Open(EventLoop &event_loop, const char *path,
		       std::size_t chunk_size, uint64_t position,
		       ChunkRead::OpenMode mode,
		       std::chrono::steady_clock::duration delay)
{
	if (chunk_size == 0)
		throw std::invalid_argument("Chunk size is zero");

	const int fd = open(path, (mode == ChunkRead::OpenMode::WRITE
				   ? O_RDWR : O_RDONLY)|O_CLOEXEC|O_NOCTTY);
	if (fd < 0) {
		const int e = errno;
		throw MakeErrno(e, fmt::format("Failed to open {}", path).c_str());
	}

	struct stat st;
	if (fstat(fd, &st) < 0) {
		const int e = errno;
		close(fd);
		throw MakeErrno(e, fmt::format("Failed to stat {}", path).c_str());
	}

	if (!S_ISREG(st.st_mode)) {
		close(fd);
		throw std::runtime_error(fmt::format("Not a regular file: {}", path));
	}

	const uint64_t length = st.st_size;
	if (position > length) {
		close(fd);
		throw std::invalid_argument(fmt::format("Position {} is beyond the end of {}",
							position, path));
	}

	std::unique_ptr<LocalChunkedFile> file(new LocalChunkedFile(event_loop,
								    path, fd,
								    length,
								    chunk_size,
								    position,
								    mode,
								    delay));

	/* load the chunk containing the start position, and position
	   it there */
	auto chunk = file->ReadChunk(position / chunk_size);
	chunk.SkipTo(position % chunk_size);
	file->SetCurrentChunk(std::move(chunk));

	return file;
}

Chunk
LocalChunkedFile::ReadChunk(uint64_t index) const
{
	const uint64_t offset = index * GetChunkSize();
	const std::size_t size = offset < GetLength()
		? std::min<uint64_t>(GetChunkSize(), GetLength() - offset)
		: 0;

	std::vector<std::byte> data(size);

	std::size_t fill = 0;
	while (fill < size) {
		ssize_t nbytes = pread(fd, data.data() + fill, size - fill,
				       offset + fill);
		if (nbytes < 0) {
			const int e = errno;
			throw MakeErrno(e, fmt::format("Failed to read chunk {} from {}",
						       index, path).c_str());
		}

		if (nbytes == 0)
			throw std::runtime_error(fmt::format("Premature end of {} in chunk {}",
							     path, index));

		fill += nbytes;
	}

	return {index, std::move(data)};
}

ChunkRead::FileMetadata
LocalChunkedFile::MakeMetadata() const noexcept
{
	ChunkRead::FileMetadata metadata;

	if (const auto slash = path.rfind('/'); slash != path.npos)
		metadata.filename = path.substr(slash + 1);
	else
		metadata.filename = path;

	metadata.length = GetLength();
	metadata.chunk_size = GetChunkSize();

	struct stat st;
	if (fd >= 0 && fstat(fd, &st) == 0) {
		metadata.id = fmt::format("{:x}:{:x}",
					  (uint64_t)st.st_dev,
					  (uint64_t)st.st_ino);
		metadata.upload_date = std::chrono::system_clock::from_time_t(st.st_mtime);
	}

	return metadata;
}

void
LocalChunkedFile::Finalize()
{
	if (GetOpenMode() == ChunkRead::OpenMode::WRITE && fsync(fd) < 0) {
		const int e = errno;
		throw MakeErrno(e, fmt::format("Failed to commit {}", path).c_str());
	}

	if (close(std::exchange(fd, -1)) < 0) {
		const int e = errno;
		throw MakeErrno(e, fmt::format("Failed to close {}", path).c_str());
	}
}

void
LocalChunkedFile::FetchChunk(uint64_t index, ChunkFetchHandler &handler,
			     CancellablePointer &cancel_ptr) noexcept
{
	assert(!fetch_operation.IsPending());

	cancel_ptr = fetch_operation;
	fetch_operation.Start(index, handler);
}

void
LocalChunkedFile::FetchOperation::OnTimer() noexcept
{
	Chunk chunk;

	try {
		if (file.fd < 0)
			throw std::runtime_error("File has been closed already");

		chunk = file.ReadChunk(index);
	} catch (...) {
		handler->OnChunkFetchError(std::current_exception());
		return;
	}

	handler->OnChunkFetched(std::move(chunk));
}

void
LocalChunkedFile::CloseResource(ChunkedFileCloseHandler &handler,
				CancellablePointer &cancel_ptr) noexcept
{
	assert(!close_operation.IsPending());

	cancel_ptr = close_operation;
	close_operation.Start(handler);
}

void
LocalChunkedFile::CloseOperation::OnTimer() noexcept
{
	auto &_handler = *handler;

	/* collect the metadata before the file descriptor is gone */
	const auto metadata = file.MakeMetadata();

	try {
		if (file.fd < 0)
			throw std::runtime_error("File has been closed already");

		file.Finalize();
	} catch (...) {
		_handler.OnChunkedFileCloseError(std::current_exception(),
						 &metadata);
		return;
	}

	_handler.OnChunkedFileClosed(&metadata);
}
