// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DecodeCommand.hxx"
#include "pg/BinaryValue.hxx"
#include "pg/Hex.hxx"
#include "pg/Timestamp.hxx"
#include "time/ISO8601.hxx"
#include "io/Logger.hxx"
#include "util/HexParse.hxx"

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <stdexcept>

using std::string_view_literals::operator""sv;

static void
SetMode(DecodeConfig &config, DecodeConfig::Mode mode)
{
	/* "--binary" and "--encode" are mutually exclusive */
	if (config.mode != DecodeConfig::Mode::LITTLE_ENDIAN_HEX &&
	    config.mode != mode)
		throw Usage{};

	config.mode = mode;
}

DecodeConfig
ParseCommandLine(std::span<const char *const> args)
{
	DecodeConfig config;

	for (const std::string_view arg : args) {
		if (arg == "-v"sv)
			++config.verbose;
		else if (arg == "--iso8601"sv)
			config.iso8601 = true;
		else if (arg == "--binary"sv)
			SetMode(config, DecodeConfig::Mode::BINARY_HEX);
		else if (arg == "--encode"sv)
			SetMode(config, DecodeConfig::Mode::ENCODE);
		else if (arg.starts_with('-') && arg.size() > 1)
			throw Usage{};
		else if (config.input == nullptr)
			config.input = arg.data();
		else
			throw Usage{};
	}

	if (config.input == nullptr)
		throw Usage{};

	if (config.iso8601 && config.mode == DecodeConfig::Mode::ENCODE)
		throw Usage{};

	return config;
}

/**
 * Parse 16 hex digits in network byte order.
 */
static int64_t
DecodeBigEndianHex(std::string_view hex)
{
	std::array<std::byte, sizeof(int64_t)> buffer;
	if (!ParseHexFixed(hex, buffer))
		throw std::invalid_argument{"Malformed binary timestamp"};

	return Pg::BinaryValue{buffer}.ToBigInt();
}

std::string
Decode(const DecodeConfig &config)
{
	const LLogger logger{"decode"};

	const auto hex = StripByteaPrefix(config.input);
	logger.Fmt(2, "decoding '{}'", hex);

	const int64_t value = config.mode == DecodeConfig::Mode::BINARY_HEX
		? DecodeBigEndianHex(hex)
		: Pg::DecodeLittleEndianHex(hex);
	logger(2, "microseconds since 2000-01-01: ", value);

	const auto t = Pg::ConvertEpochMicroseconds(value);

	return fmt::format("{} {}", value,
			   config.iso8601 ? FormatISO8601(t) : Pg::FormatTimestamp(t));
}

std::string
Encode(const DecodeConfig &config)
{
	const LLogger logger{"encode"};

	const auto t = Pg::ParseTimestamp(config.input);
	logger.Fmt(2, "parsed '{}' as {}", config.input, FormatISO8601(t));

	const int64_t value = Pg::ToEpochMicroseconds(t);
	return fmt::format("{} {}", value, Pg::EncodeLittleEndianHex(value));
}
