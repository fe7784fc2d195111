// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Hex representations of 64 bit integers as they appear in raw
 * PostgreSQL page and tuple dumps.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Pg {

/**
 * The number of hex digits of a little-endian 64 bit token.
 */
constexpr std::size_t LITTLE_ENDIAN_HEX_LENGTH = 16;

/**
 * Decode a hex string of exactly 16 digits (upper or lower case) to
 * a signed 64 bit integer.  The digits are taken as 8 bytes in the
 * order they appear in the string, and the first byte is the least
 * significant one (little-endian); the result is interpreted as
 * two's complement.
 *
 * Example: "0a00000000000000" decodes to 10.
 *
 * Throws std::invalid_argument on syntax error.
 */
int64_t
DecodeLittleEndianHex(std::string_view src);

/**
 * The inverse of DecodeLittleEndianHex(): format the integer as 16
 * lower-case hex digits, least significant byte first.
 */
std::string
EncodeLittleEndianHex(int64_t value);

} /* namespace Pg */
