// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "pg/Hex.hxx"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>

using std::string_view_literals::operator""sv;

TEST(PgTest, DecodeLittleEndianHex)
{
	EXPECT_EQ(Pg::DecodeLittleEndianHex("0000000000000000"sv), 0);
	EXPECT_EQ(Pg::DecodeLittleEndianHex("0a00000000000000"sv), 10);
	EXPECT_EQ(Pg::DecodeLittleEndianHex("0001000000000000"sv), 256);
	EXPECT_EQ(Pg::DecodeLittleEndianHex("ffffffffffffffff"sv), -1);
	EXPECT_EQ(Pg::DecodeLittleEndianHex("feffffffffffffff"sv), -2);
	EXPECT_EQ(Pg::DecodeLittleEndianHex("0000000000000080"sv),
		  std::numeric_limits<int64_t>::min());
	EXPECT_EQ(Pg::DecodeLittleEndianHex("ffffffffffffff7f"sv),
		  std::numeric_limits<int64_t>::max());

	/* one day before 2000-01-01 */
	EXPECT_EQ(Pg::DecodeLittleEndianHex("00a028e2ebffffff"sv),
		  INT64_C(-86400000000));
}

TEST(PgTest, DecodeLittleEndianHexUpperCase)
{
	EXPECT_EQ(Pg::DecodeLittleEndianHex("0A00000000000000"sv), 10);
	EXPECT_EQ(Pg::DecodeLittleEndianHex("A922E78E1BDD0200"sv),
		  Pg::DecodeLittleEndianHex("a922e78e1bdd0200"sv));
	EXPECT_EQ(Pg::DecodeLittleEndianHex("a922E78e1BdD0200"sv),
		  INT64_C(806060384789161));
}

TEST(PgTest, DecodeLittleEndianHexSample)
{
	EXPECT_EQ(Pg::DecodeLittleEndianHex("a922e78e1bdd0200"sv),
		  INT64_C(806060384789161));
}

TEST(PgTest, DecodeLittleEndianHexWrongLength)
{
	EXPECT_THROW(Pg::DecodeLittleEndianHex({}), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeLittleEndianHex(""sv), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeLittleEndianHex("0a"sv), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeLittleEndianHex("0a0000000000000"sv), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeLittleEndianHex("0a000000000000000"sv), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeLittleEndianHex("0a000000000000000000000000000000"sv),
		     std::invalid_argument);
	EXPECT_THROW(Pg::DecodeLittleEndianHex("\\xa922e78e1bdd0200"sv), std::invalid_argument);
}

TEST(PgTest, DecodeLittleEndianHexMalformed)
{
	EXPECT_THROW(Pg::DecodeLittleEndianHex("g000000000000000"sv), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeLittleEndianHex("000000000000000g"sv), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeLittleEndianHex("0a 0000000000000"sv), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeLittleEndianHex("0x0a000000000000"sv), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeLittleEndianHex("-a00000000000000"sv), std::invalid_argument);
	EXPECT_THROW(Pg::DecodeLittleEndianHex("0a000000\0" "0000000"sv), std::invalid_argument);
}

TEST(PgTest, EncodeLittleEndianHex)
{
	/* allocates the result, so std::bad_alloc may escape */
	static_assert(!noexcept(Pg::EncodeLittleEndianHex(0)));

	EXPECT_EQ(Pg::EncodeLittleEndianHex(0), "0000000000000000");
	EXPECT_EQ(Pg::EncodeLittleEndianHex(10), "0a00000000000000");
	EXPECT_EQ(Pg::EncodeLittleEndianHex(-1), "ffffffffffffffff");
	EXPECT_EQ(Pg::EncodeLittleEndianHex(std::numeric_limits<int64_t>::min()),
		  "0000000000000080");
	EXPECT_EQ(Pg::EncodeLittleEndianHex(INT64_C(806060384789161)),
		  "a922e78e1bdd0200");
}

TEST(PgTest, LittleEndianHexRoundTrip)
{
	static constexpr std::string_view tokens[] = {
		"0000000000000000"sv,
		"0a00000000000000"sv,
		"a922e78e1bdd0200"sv,
		"00a028e2ebffffff"sv,
		"ffffffffffffffff"sv,
		"0000000000000080"sv,
		"ffffffffffffff7f"sv,
		"0123456789abcdef"sv,
	};

	for (const auto token : tokens)
		EXPECT_EQ(Pg::EncodeLittleEndianHex(Pg::DecodeLittleEndianHex(token)),
			  token);

	/* upper case digits are normalized */
	EXPECT_EQ(Pg::EncodeLittleEndianHex(Pg::DecodeLittleEndianHex("0123456789ABCDEF"sv)),
		  "0123456789abcdef");
}
