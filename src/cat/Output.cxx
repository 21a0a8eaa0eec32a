// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Output.hxx"
#include "system/Error.hxx"

#include <errno.h>
#include <unistd.h>

std::size_t
WriteOutput(int fd, std::span<const std::byte> src)
{
	while (true) {
		const ssize_t nbytes = write(fd, src.data(), src.size());
		if (nbytes >= 0)
			return nbytes;

		if (errno != EINTR)
			throw MakeErrno("Failed to write");
	}
}
