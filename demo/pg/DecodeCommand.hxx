// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <span>
#include <string>
#include <string_view>

/**
 * Thrown by ParseCommandLine() on a malformed command line; the
 * caller prints the usage text.
 */
struct Usage {};

struct DecodeConfig {
	const char *input = nullptr;

	enum class Mode {
		/**
		 * The input is a little-endian hex token.
		 */
		LITTLE_ENDIAN_HEX,

		/**
		 * The input is a big-endian hex token (PostgreSQL
		 * binary format).
		 */
		BINARY_HEX,

		/**
		 * The input is a PostgreSQL text time stamp which
		 * shall be encoded.
		 */
		ENCODE,
	} mode = Mode::LITTLE_ENDIAN_HEX;

	bool iso8601 = false;

	unsigned verbose = 1;
};

/**
 * Parse the command line (without argv[0]).
 *
 * Throws #Usage on error.
 */
DecodeConfig
ParseCommandLine(std::span<const char *const> args);

/**
 * Strip the "\x" prefix which PostgreSQL uses for "bytea" values.
 */
constexpr std::string_view
StripByteaPrefix(std::string_view s) noexcept
{
	using std::string_view_literals::operator""sv;

	if (s.starts_with("\\x"sv))
		s.remove_prefix(2);
	return s;
}

/**
 * Decode the token according to the configured mode and return the
 * output line: the number of microseconds since 2000-01-01 and the
 * time stamp.
 */
std::string
Decode(const DecodeConfig &config);

/**
 * Parse the text time stamp and return the output line: the number
 * of microseconds since 2000-01-01 and its little-endian hex token.
 */
std::string
Encode(const DecodeConfig &config);
