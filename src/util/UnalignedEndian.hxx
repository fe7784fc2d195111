// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Fixed byte order access to 64 bit integers in byte buffers which
 * may be misaligned.  These do not depend on the host byte order.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * Write a 64 bit integer with the least significant byte first.
 *
 * @return the end of the destination buffer
 */
constexpr std::byte *
WriteUnalignedLE64(std::byte *p, uint_least64_t value) noexcept
{
	for (unsigned i = 0; i < 8; ++i) {
		*p++ = static_cast<std::byte>(value);
		value >>= 8;
	}

	return p;
}

/**
 * Write a 64 bit integer with the most significant byte first
 * (network byte order).
 *
 * @return the end of the destination buffer
 */
constexpr std::byte *
WriteUnalignedBE64(std::byte *p, uint_least64_t value) noexcept
{
	for (int shift = 56; shift >= 0; shift -= 8)
		*p++ = static_cast<std::byte>(value >> shift);

	return p;
}

constexpr uint_least64_t
ReadUnalignedLE64(std::span<const std::byte, 8> src) noexcept
{
	uint_least64_t value = 0;
	for (std::size_t i = src.size(); i-- > 0;)
		value = (value << 8) | static_cast<uint_least64_t>(src[i]);
	return value;
}

constexpr uint_least64_t
ReadUnalignedBE64(std::span<const std::byte, 8> src) noexcept
{
	uint_least64_t value = 0;
	for (const auto i : src)
		value = (value << 8) | static_cast<uint_least64_t>(i);
	return value;
}
