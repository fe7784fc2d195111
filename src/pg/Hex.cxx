// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Hex.hxx"
#include "util/HexFormat.hxx"
#include "util/HexParse.hxx"
#include "util/UnalignedEndian.hxx"

#include <array>
#include <stdexcept>

namespace Pg {

int64_t
DecodeLittleEndianHex(std::string_view src)
{
	if (src.size() != LITTLE_ENDIAN_HEX_LENGTH)
		throw std::invalid_argument{"Hex string must be exactly 16 characters (8 bytes)"};

	std::array<std::byte, sizeof(int64_t)> bytes;
	if (ParseHexFixed(src.data(), bytes) == nullptr)
		throw std::invalid_argument{"Malformed hex digit"};

	/* the conversion to a signed type is two's complement
	   (guaranteed since C++20) */
	return static_cast<int64_t>(ReadUnalignedLE64(bytes));
}

std::string
EncodeLittleEndianHex(int64_t value)
{
	std::array<std::byte, sizeof(value)> bytes;
	WriteUnalignedLE64(bytes.data(), static_cast<uint_least64_t>(value));

	std::string result(LITTLE_ENDIAN_HEX_LENGTH, '\0');
	HexFormat(result.data(), bytes);
	return result;
}

} /* namespace Pg */
