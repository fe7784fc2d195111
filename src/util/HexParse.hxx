// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "CharUtil.hxx"

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * Parse one hex digit (upper or lower case).
 *
 * @return the digit value or -1 if the character is not a hex digit
 */
constexpr int
ParseHexDigit(char ch) noexcept
{
	if (IsDigitASCII(ch))
		return ch - '0';
	else if (ch >= 'a' && ch <= 'f')
		return ch - 'a' + 0xa;
	else if (ch >= 'A' && ch <= 'F')
		return ch - 'A' + 0xa;
	else
		return -1;
}

/**
 * Parse the hex digits of a fixed-length string to the given integer
 * reference.  The most significant digit comes first.  Both upper
 * and lower case digits are accepted.
 *
 * @return the end of the parsed string on success, nullptr on error
 */
template<std::unsigned_integral T>
constexpr const char *
ParseHexFixed(const char *input, T &output) noexcept
{
	T value{};

	for (std::size_t j = 0; j < sizeof(T) * 2; ++j) {
		int digit = ParseHexDigit(*input++);
		if (digit < 0)
			return nullptr;

		value = static_cast<T>((value << 4) | static_cast<T>(digit));
	}

	output = value;
	return input;
}

constexpr const char *
ParseHexFixed(const char *input, std::byte &output) noexcept
{
	uint8_t value{};
	input = ParseHexFixed(input, value);
	if (input != nullptr)
		output = static_cast<std::byte>(value);
	return input;
}

/**
 * Parse the hex digits of a fixed-length string to the given byte
 * (or integer) span, in the order they appear in the string.
 *
 * @return the end of the parsed string on success, nullptr on error
 */
template<typename T, std::size_t size>
constexpr const char *
ParseHexFixed(const char *input, std::span<T, size> output) noexcept
{
	for (auto &i : output) {
		input = ParseHexFixed(input, i);
		if (input == nullptr)
			return nullptr;
	}

	return input;
}

template<typename T, std::size_t size>
constexpr const char *
ParseHexFixed(const char *input, std::array<T, size> &output) noexcept
{
	return ParseHexFixed(input, std::span{output});
}

/**
 * Like ParseHexFixed(const char *, T &), but the string must have
 * exactly the number of digits needed to fill the output.
 */
template<typename T>
constexpr bool
ParseHexFixed(std::string_view input, T &output) noexcept
{
	return input.size() == sizeof(output) * 2 &&
		ParseHexFixed(input.data(), output) != nullptr;
}
