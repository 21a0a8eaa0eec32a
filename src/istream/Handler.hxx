// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <exception>
#include <span>

/**
 * The consumer side of a pull stream.  Data is delivered only after
 * the consumer has asked for it.
 */
class IstreamHandler {
public:
	/**
	 * A unit of data has been produced.
	 *
	 * @param src the data; it is only valid during this call and
	 * is never empty
	 * @return the number of bytes accepted; the rest will be
	 * offered again when more data is requested.  Ignored if the
	 * stream has been cancelled or destroyed from inside this
	 * call.
	 */
	virtual std::size_t OnData(std::span<const std::byte> src) noexcept = 0;

	/**
	 * All data has been delivered, or the stream has been stopped.
	 */
	virtual void OnEof() noexcept = 0;

	/**
	 * Producing data has failed.
	 */
	virtual void OnError(std::exception_ptr error) noexcept = 0;
};
