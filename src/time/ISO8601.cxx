// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ISO8601.hxx"

#include <fmt/format.h>

std::string
FormatISO8601(const BrokenDownTime &t)
{
	return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
			   t.year, t.month, t.day,
			   t.hour, t.minute, t.second,
			   t.microsecond);
}

std::string
FormatISO8601(PreciseTimePoint tp)
{
	return FormatISO8601(SplitTime(tp));
}
