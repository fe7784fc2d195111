// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Convert.hxx"

#include <string>

/**
 * Format the given time stamp in ISO 8601 notation with microsecond
 * precision and the "Z" (UTC) suffix, e.g.
 * "2000-01-01T00:00:00.000000Z".
 */
std::string
FormatISO8601(const BrokenDownTime &t);

std::string
FormatISO8601(PreciseTimePoint tp);
