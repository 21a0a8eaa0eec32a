// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "util/StringParser.hxx"

#include <limits>
#include <stdexcept>

#include <errno.h>
#include <stdlib.h>

using std::string_view_literals::operator""sv;

/**
 * Parse a decimal number without sign.  Returns the position of the
 * first character after the number in #endptr_r.
 */
static uint64_t
ParseDecimal(const char *s, const char *&endptr_r)
{
	if (*s < '0' || *s > '9')
		throw std::runtime_error("Failed to parse number");

	char *endptr;
	errno = 0;
	const uint64_t value = strtoull(s, &endptr, 10);
	if (errno == ERANGE)
		throw std::runtime_error("Number is too large");

	endptr_r = endptr;
	return value;
}

static uint64_t
ParsePosition(const char *s)
{
	const char *endptr;
	const auto value = ParseDecimal(s, endptr);
	if (*endptr != 0)
		throw std::runtime_error("Garbage after number");

	return value;
}

/**
 * Parse a size with an optional "k", "M" or "G" suffix.
 */
static std::size_t
ParseChunkSize(const char *s)
{
	const char *endptr;
	const auto value = ParseDecimal(s, endptr);

	std::size_t multiplier = 1;
	switch (*endptr) {
	case 0:
		break;

	case 'k':
		multiplier = 1024;
		++endptr;
		break;

	case 'M':
		multiplier = 1024 * 1024;
		++endptr;
		break;

	case 'G':
		multiplier = 1024 * 1024 * 1024;
		++endptr;
		break;

	default:
		throw std::runtime_error("Unknown size suffix");
	}

	if (*endptr != 0)
		throw std::runtime_error("Garbage after size");

	if (value > std::numeric_limits<std::size_t>::max() / multiplier)
		throw std::runtime_error("Size is too large");

	return value * multiplier;
}

void
ChunkCatConfig::HandleSet(std::string_view name, const char *value)
{
	if (name == "chunk_size"sv) {
		const auto size = ParseChunkSize(value);
		if (size == 0)
			throw std::runtime_error("Chunk size must be positive");

		if (size > 1024 * 1024 * 1024)
			throw std::runtime_error("Chunk size is too large");

		chunk_size = size;
	} else if (name == "position"sv) {
		position = ParsePosition(value);
	} else if (name == "fetch_delay_ms"sv) {
		const auto ms = ParseUnsignedLong(value);
		if (ms > 60 * 1000)
			throw std::runtime_error("Delay is too long");

		fetch_delay = std::chrono::milliseconds(ms);
	} else if (name == "autoclose"sv) {
		autoclose = ParseBool(value);
	} else if (name == "write_mode"sv) {
		write_mode = ParseBool(value);
	} else
		throw std::runtime_error("Unknown variable");
}
