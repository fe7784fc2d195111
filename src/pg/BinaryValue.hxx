// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/UnalignedEndian.hxx"

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

namespace Pg {

/**
 * A value in the PostgreSQL binary format, e.g. a field of a result
 * obtained in binary mode or of a "COPY BINARY" stream.  Integers are
 * in network byte order.
 */
struct BinaryValue : std::span<const std::byte> {
	using std::span<const std::byte>::span;

	constexpr BinaryValue(const std::span<const std::byte> src) noexcept
		:std::span<const std::byte>(src) {}

	constexpr BinaryValue(const void *_data, std::size_t _size) noexcept
		:std::span<const std::byte>((const std::byte *)_data, _size) {}

	/**
	 * Interpret this value as a PostgreSQL "int8" (or any other
	 * type whose binary representation is a 64 bit integer, such
	 * as "timestamptz").
	 *
	 * Throws std::invalid_argument if the size is not 8 bytes.
	 */
	int64_t ToBigInt() const {
		if (size() != sizeof(int64_t))
			throw std::invalid_argument("Wrong size for a 64 bit integer");

		return static_cast<int64_t>(ReadUnalignedBE64(first<sizeof(int64_t)>()));
	}
};

} /* namespace Pg */
