// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Convert.hxx"

#include <stdexcept>

using namespace std::chrono;

BrokenDownTime
SplitTime(PreciseTimePoint tp) noexcept
{
	/* floor() rounds towards the past, which keeps the time of
	   day non-negative for time stamps before 1970 */
	const auto day = floor<days>(tp);
	const year_month_day ymd{day};
	const hh_mm_ss tod{tp - day};

	return {
		static_cast<int>(ymd.year()),
		static_cast<unsigned>(ymd.month()),
		static_cast<unsigned>(ymd.day()),
		static_cast<unsigned>(tod.hours().count()),
		static_cast<unsigned>(tod.minutes().count()),
		static_cast<unsigned>(tod.seconds().count()),
		static_cast<unsigned>(tod.subseconds().count()),
	};
}

PreciseTimePoint
JoinTime(const BrokenDownTime &t)
{
	if (t.year < static_cast<int>(year::min()) ||
	    t.year > static_cast<int>(year::max()))
		throw std::invalid_argument("Invalid year");

	if (t.month < 1 || t.month > 12 || t.day < 1 || t.day > 31)
		throw std::invalid_argument("Invalid date");

	const year_month_day ymd{year{t.year}, month{t.month}, day{t.day}};
	if (!ymd.ok())
		throw std::invalid_argument("Invalid date");

	if (t.hour >= 24 || t.minute >= 60 || t.second >= 60)
		throw std::invalid_argument("Invalid time of day");

	if (t.microsecond >= 1000000)
		throw std::invalid_argument("Invalid fraction of second");

	return sys_days{ymd} + hours{t.hour} + minutes{t.minute} +
		seconds{t.second} + microseconds{t.microsecond};
}
