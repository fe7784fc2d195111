// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Decode the raw representation of a PostgreSQL "timestamptz" value
 * (e.g. copied from a "pageinspect" tuple dump or a binary wire
 * capture) to a readable time stamp, or encode a time stamp to that
 * representation.
 */

#include "DecodeCommand.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <fmt/core.h>

#include <cstdlib>

#include <stdio.h>

int
main(int argc, char **argv)
try {
	const auto config = ParseCommandLine({argv + 1, static_cast<std::size_t>(argc - 1)});

	SetLogLevel(config.verbose);

	const auto line = config.mode == DecodeConfig::Mode::ENCODE
		? Encode(config)
		: Decode(config);
	fmt::print("{}\n", line);

	return EXIT_SUCCESS;
} catch (Usage) {
	fprintf(stderr, "Usage: decode-timestamptz [-v] [--iso8601] [--binary] TOKEN\n"
		"       decode-timestamptz [-v] --encode TIMESTAMP\n");
	return EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
