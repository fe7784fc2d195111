// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstdint>

/**
 * A time stamp with microsecond resolution relative to the Unix
 * epoch (UTC).
 */
using PreciseTimePoint = std::chrono::sys_time<std::chrono::microseconds>;

/**
 * A UTC time stamp split into calendar fields.  Unlike struct tm, all
 * fields hold their natural values (e.g. the year is not relative to
 * 1900 and the month counts from 1), and the sub-second part is kept
 * in a separate microsecond field.
 */
struct BrokenDownTime {
	int year;
	unsigned month, day;
	unsigned hour, minute, second;
	unsigned microsecond;

	friend constexpr bool operator==(const BrokenDownTime &,
					 const BrokenDownTime &) noexcept = default;
};

/**
 * Split a time stamp into calendar fields (proleptic Gregorian
 * calendar, UTC).
 */
[[gnu::const]]
BrokenDownTime
SplitTime(PreciseTimePoint tp) noexcept;

/**
 * The inverse of SplitTime().
 *
 * Throws std::invalid_argument if a field is out of its range (e.g.
 * February 30th or minute 60).
 */
PreciseTimePoint
JoinTime(const BrokenDownTime &t);
