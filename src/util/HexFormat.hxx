// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

extern const char hex_digits[];

/**
 * Format one byte as two lower-case hex digits.
 *
 * @return the end of the destination buffer
 */
[[gnu::always_inline]]
inline char *
HexFormatUint8Fixed(char *dest, uint8_t number) noexcept
{
	*dest++ = hex_digits[(number >> 4) & 0xf];
	*dest++ = hex_digits[number & 0xf];
	return dest;
}

/**
 * Format the given bytes as lower-case hex digits, in the order they
 * appear in memory.  The destination buffer must be large enough for
 * two characters per byte; no null terminator is written.
 *
 * @return the end of the destination buffer
 */
inline char *
HexFormat(char *dest, std::span<const std::byte> src) noexcept
{
	for (const auto i : src)
		dest = HexFormatUint8Fixed(dest, static_cast<uint8_t>(i));
	return dest;
}
