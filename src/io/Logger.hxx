// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <iterator>
#include <span>
#include <string_view>
#include <utility>

namespace LoggerDetail {

extern unsigned max_level;

inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

/**
 * Write one line to stderr, prefixed with the domain in square
 * brackets.
 */
void
WriteV(std::string_view domain, std::span<const std::string_view> buffers) noexcept;

void
VFmt(unsigned level, std::string_view domain,
     fmt::string_view format_str, fmt::format_args args) noexcept;

} /* namespace LoggerDetail */

/**
 * Set the maximum level of messages to be logged.  Level 1 is the
 * default; higher numbers mean more verbose output.
 */
inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

/**
 * A logger which prefixes each line with a string literal (the
 * "domain").
 */
class LLogger {
	std::string_view domain;

public:
	constexpr explicit LLogger(std::string_view _domain) noexcept
		:domain(_domain) {}

	static bool CheckLevel(unsigned level) noexcept {
		return LoggerDetail::CheckLevel(level);
	}

	constexpr std::string_view GetDomain() const noexcept {
		return domain;
	}

	/**
	 * Log the concatenation of all parameters.  Strings are
	 * copied verbatim, numbers are formatted in decimal.
	 */
	template<typename... Params>
	void operator()(unsigned level, const Params &...params) const noexcept {
		if (!CheckLevel(level))
			return;

		fmt::memory_buffer buffer;
		(fmt::format_to(std::back_inserter(buffer), "{}", params), ...);

		const std::string_view line[]{{buffer.data(), buffer.size()}};
		LoggerDetail::WriteV(domain, line);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		LoggerDetail::VFmt(level, domain, format_str,
				   fmt::make_format_args(args...));
	}
};
