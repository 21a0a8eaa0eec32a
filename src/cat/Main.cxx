// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Stream a file to stdout, chunk by chunk, through #ChunkIstream.
 */

#include "CommandLine.hxx"
#include "Config.hxx"
#include "Output.hxx"
#include "chunk/LocalFile.hxx"
#include "istream/ChunkIstream.hxx"
#include "event/Loop.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <stdexcept>

#include <stdlib.h>
#include <unistd.h>

class Context final : ChunkIstreamHandler {
	const LLogger logger{"chunk_cat"};

	EventLoop event_loop;

	const std::unique_ptr<LocalChunkedFile> file;

	ChunkIstream istream;

	std::exception_ptr error;

	bool eof = false, closed = false;

public:
	Context(const ChunkCatConfig &config, const char *path)
		:file(LocalChunkedFile::Open(event_loop, path,
					     config.chunk_size,
					     config.position,
					     config.write_mode
					     ? ChunkRead::OpenMode::WRITE
					     : ChunkRead::OpenMode::READ,
					     config.fetch_delay)),
		 istream(event_loop, *file, *this, config.autoclose)
	{
		logger(5, "streaming ",
		       fmt::format_int(istream.GetTotalChunks()).c_str(),
		       " chunks from ", path);
	}

	void Run() {
		istream.Read();

		if (!closed)
			event_loop.Dispatch();

		if (error)
			std::rethrow_exception(error);

		if (!eof || !closed)
			throw std::runtime_error("Stream stalled");
	}

private:
	/* virtual methods from class IstreamHandler */
	std::size_t OnData(std::span<const std::byte> src) noexcept override;
	void OnEof() noexcept override;
	void OnError(std::exception_ptr ep) noexcept override;

	/* virtual methods from class ChunkIstreamHandler */
	void OnChunkIstreamClose(const ChunkRead::FileMetadata *metadata) noexcept override;
};

std::size_t
Context::OnData(std::span<const std::byte> src) noexcept
{
	std::size_t nbytes;
	try {
		nbytes = WriteOutput(STDOUT_FILENO, src);
	} catch (...) {
		istream.Cancel(std::current_exception());
		return 0;
	}

	istream.Read();
	return nbytes;
}

void
Context::OnEof() noexcept
{
	eof = true;
}

void
Context::OnError(std::exception_ptr ep) noexcept
{
	if (!error)
		error = std::move(ep);
}

void
Context::OnChunkIstreamClose(const ChunkRead::FileMetadata *metadata) noexcept
{
	closed = true;

	if (metadata != nullptr) {
		const auto upload_date = std::chrono::system_clock::to_time_t(metadata->upload_date);
		const auto msg = fmt::format("closed \"{}\" id={} length={} chunk_size={} upload_date={:%F %T}",
					     metadata->filename, metadata->id,
					     metadata->length, metadata->chunk_size,
					     fmt::gmtime(upload_date));
		logger(4, std::string_view{msg});
	} else
		logger(5, "closed");

	event_loop.Break();
}

int
main(int argc, char **argv)
try {
	ChunkCatConfig config;
	ChunkCatCmdLine cmdline;
	ParseCommandLine(cmdline, config, argc, argv);

	Context context(config, cmdline.path);
	context.Run();

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
