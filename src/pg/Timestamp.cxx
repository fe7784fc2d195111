// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Timestamp.hxx"
#include "util/CharUtil.hxx"

#include <fmt/format.h>

#include <cassert>
#include <limits>
#include <stdexcept>

namespace Pg {

static constexpr int64_t min_epoch_microseconds =
	(MIN_TIMESTAMP - TIMESTAMP_EPOCH).count();

static constexpr int64_t max_epoch_microseconds =
	(MAX_TIMESTAMP - TIMESTAMP_EPOCH).count();

static constexpr bool
IsInRange(Timestamp t) noexcept
{
	return t >= MIN_TIMESTAMP && t <= MAX_TIMESTAMP;
}

Timestamp
ConvertEpochMicroseconds(int64_t value)
{
	/* PostgreSQL's DT_NOBEGIN and DT_NOEND */
	if (value == std::numeric_limits<int64_t>::min())
		throw std::out_of_range("Timestamp is -infinity");
	if (value == std::numeric_limits<int64_t>::max())
		throw std::out_of_range("Timestamp is infinity");

	if (value < min_epoch_microseconds || value > max_epoch_microseconds)
		throw std::out_of_range("Timestamp out of range");

	return TIMESTAMP_EPOCH + std::chrono::microseconds{value};
}

int64_t
ToEpochMicroseconds(Timestamp t)
{
	if (!IsInRange(t))
		throw std::out_of_range("Timestamp out of range");

	return (t - TIMESTAMP_EPOCH).count();
}

Timestamp
DecodeBinaryTimestamp(BinaryValue value)
{
	return ConvertEpochMicroseconds(value.ToBigInt());
}

/**
 * Parse a decimal number with at least #min_digits and at most
 * #max_digits digits.
 *
 * @return the end of the number or nullptr on error
 */
static const char *
ParseDecimal(const char *s, std::size_t min_digits, std::size_t max_digits,
	     unsigned &value_r) noexcept
{
	unsigned value = 0;
	std::size_t n = 0;

	while (IsDigitASCII(*s)) {
		if (n >= max_digits)
			return nullptr;

		value = value * 10 + unsigned(*s++ - '0');
		++n;
	}

	if (n < min_digits)
		return nullptr;

	value_r = value;
	return s;
}

static const char *
ParseDecimalChecked(const char *s, std::size_t min_digits,
		    std::size_t max_digits, unsigned &value_r)
{
	s = ParseDecimal(s, min_digits, max_digits, value_r);
	if (s == nullptr)
		throw std::invalid_argument("Failed to parse PostgreSQL timestamp");

	return s;
}

static const char *
Expect(const char *s, char ch)
{
	if (*s != ch)
		throw std::invalid_argument("Failed to parse PostgreSQL timestamp");

	return s + 1;
}

static std::chrono::minutes
ParsePositiveTimezoneOffset(const char *&s)
{
	unsigned hours, minutes = 0;

	s = ParseDecimal(s, 2, 2, hours);
	if (s == nullptr || hours >= 24)
		throw std::invalid_argument("Failed to parse time zone offset");

	if (*s == ':') {
		s = ParseDecimal(s + 1, 2, 2, minutes);
		if (s == nullptr || minutes >= 60)
			throw std::invalid_argument("Failed to parse time zone offset");
	}

	return std::chrono::hours(hours) + std::chrono::minutes(minutes);
}

Timestamp
ParseTimestamp(const char *s)
{
	assert(s != nullptr);

	BrokenDownTime t{};

	unsigned year;
	s = ParseDecimalChecked(s, 4, 6, year);
	if (year > 9999)
		throw std::out_of_range("Timestamp out of range");
	t.year = static_cast<int>(year);
	s = Expect(s, '-');
	s = ParseDecimalChecked(s, 2, 2, t.month);
	s = Expect(s, '-');
	s = ParseDecimalChecked(s, 2, 2, t.day);

	if (*s != ' ' && *s != 'T')
		throw std::invalid_argument("Failed to parse PostgreSQL timestamp");
	++s;

	s = ParseDecimalChecked(s, 2, 2, t.hour);
	s = Expect(s, ':');
	s = ParseDecimalChecked(s, 2, 2, t.minute);
	s = Expect(s, ':');
	s = ParseDecimalChecked(s, 2, 2, t.second);

	if (*s == '.') {
		/* parse fractional part */
		const char *start = ++s;
		s = ParseDecimalChecked(s, 1, 6, t.microsecond);

		for (auto n = s - start; n < 6; ++n)
			t.microsecond *= 10;
	}

	auto result = JoinTime(t);

	switch (*s) {
	case '+':
		++s;
		result -= ParsePositiveTimezoneOffset(s);
		break;

	case '-':
		++s;
		result += ParsePositiveTimezoneOffset(s);
		break;

	case 'Z':
		++s;
		break;
	}

	if (*s != 0)
		throw std::invalid_argument("Garbage at end of PostgreSQL timestamp");

	if (!IsInRange(result))
		throw std::out_of_range("Timestamp out of range");

	return result;
}

std::string
FormatTimestamp(Timestamp t)
{
	const auto b = SplitTime(t);

	auto result = fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
				  b.year, b.month, b.day,
				  b.hour, b.minute, b.second);

	if (b.microsecond != 0) {
		auto fraction = fmt::format(".{:06}", b.microsecond);
		fraction.erase(fraction.find_last_not_of('0') + 1);
		result += fraction;
	}

	result += "+00";
	return result;
}

} /* namespace Pg */
