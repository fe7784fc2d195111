// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "util/HexFormat.hxx"

#include <gtest/gtest.h>

#include <array>
#include <string_view>

using std::string_view_literals::operator""sv;

TEST(HexFormat, Uint8)
{
	char buffer[2];

	EXPECT_EQ(HexFormatUint8Fixed(buffer, 0x00), buffer + 2);
	EXPECT_EQ(std::string_view(buffer, 2), "00"sv);

	HexFormatUint8Fixed(buffer, 0x0a);
	EXPECT_EQ(std::string_view(buffer, 2), "0a"sv);

	HexFormatUint8Fixed(buffer, 0xff);
	EXPECT_EQ(std::string_view(buffer, 2), "ff"sv);
}

TEST(HexFormat, Bytes)
{
	static constexpr std::array src{
		std::byte{0xa9}, std::byte{0x22}, std::byte{0xe7}, std::byte{0x00},
	};

	char buffer[8];
	EXPECT_EQ(HexFormat(buffer, src), buffer + sizeof(buffer));
	EXPECT_EQ(std::string_view(buffer, sizeof(buffer)), "a922e700"sv);

	EXPECT_EQ(HexFormat(buffer, {}), buffer);
}
