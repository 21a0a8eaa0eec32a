// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>

/**
 * Write data to a blocking file descriptor, retrying after EINTR.
 * EAGAIN is an error: there is no way to wait for writability here.
 *
 * Throws std::system_error on error.
 *
 * @return the number of bytes written, which may be less than
 * requested
 */
std::size_t
WriteOutput(int fd, std::span<const std::byte> src);
