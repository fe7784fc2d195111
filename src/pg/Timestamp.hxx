// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "BinaryValue.hxx"
#include "time/Convert.hxx"

#include <chrono>
#include <cstdint>
#include <string>

namespace Pg {

/**
 * A PostgreSQL "timestamptz" value: an absolute UTC time stamp with
 * microsecond resolution.
 */
using Timestamp = PreciseTimePoint;

/**
 * PostgreSQL stores "timestamptz" as a signed 64 bit number of
 * microseconds since this time stamp.
 */
constexpr Timestamp TIMESTAMP_EPOCH{
	std::chrono::sys_days{std::chrono::year{2000}/std::chrono::January/1}
};

/**
 * The earliest time stamp which can be represented: 0001-01-01
 * 00:00:00 UTC.
 */
constexpr Timestamp MIN_TIMESTAMP{
	std::chrono::sys_days{std::chrono::year{1}/std::chrono::January/1}
};

/**
 * The latest time stamp which can be represented: 9999-12-31
 * 23:59:59.999999 UTC.
 */
constexpr Timestamp MAX_TIMESTAMP{
	std::chrono::sys_days{std::chrono::year{10000}/std::chrono::January/1}
	- std::chrono::microseconds{1}
};

/**
 * Convert the internal representation of a "timestamptz" (the number
 * of microseconds since #TIMESTAMP_EPOCH, may be negative) to a UTC
 * time stamp.
 *
 * Throws std::out_of_range on "infinity", "-infinity" or if the
 * result is not between #MIN_TIMESTAMP and #MAX_TIMESTAMP.
 */
Timestamp
ConvertEpochMicroseconds(int64_t value);

/**
 * The inverse of ConvertEpochMicroseconds().
 *
 * Throws std::out_of_range if the time stamp is not between
 * #MIN_TIMESTAMP and #MAX_TIMESTAMP.
 */
int64_t
ToEpochMicroseconds(Timestamp t);

/**
 * Decode a "timestamptz" in the PostgreSQL binary format.
 *
 * Throws std::invalid_argument if the value is not 8 bytes long,
 * std::out_of_range on "infinity", "-infinity" or any other value
 * outside the supported range.
 */
Timestamp
DecodeBinaryTimestamp(BinaryValue value);

/**
 * Parse a time stamp in the PostgreSQL output format
 * ("2009-02-13 23:31:30.123456+01") with microsecond resolution.
 * Without a time zone suffix, UTC is assumed.
 *
 * Throws std::invalid_argument on syntax error, std::out_of_range if
 * the result is not between #MIN_TIMESTAMP and #MAX_TIMESTAMP.
 */
Timestamp
ParseTimestamp(const char *s);

/**
 * Format the given time stamp like PostgreSQL does for "timestamptz"
 * with the session time zone UTC, e.g. "2009-02-13 23:31:30.5+00".
 * The fraction is omitted if it is zero.
 */
std::string
FormatTimestamp(Timestamp t);

} /* namespace Pg */
