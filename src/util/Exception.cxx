// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Exception.hxx"

static std::string
AppendNestedMessage(std::string &&result, const std::exception &e,
		    const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_if_nested(e);
		return std::move(result);
	} catch (const std::exception &nested) {
		result += separator;
		result += nested.what();
		return AppendNestedMessage(std::move(result), nested,
					   fallback, separator);
	} catch (const char *s) {
		result += separator;
		result += s;
		return std::move(result);
	} catch (...) {
		result += separator;
		result += fallback;
		return std::move(result);
	}
}

std::string
GetFullMessage(const std::exception &e,
	       const char *fallback, const char *separator) noexcept
{
	return AppendNestedMessage(e.what(), e, fallback, separator);
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_exception(std::move(ep));
	} catch (const std::exception &e) {
		return GetFullMessage(e, fallback, separator);
	} catch (const char *s) {
		return s;
	} catch (...) {
		return fallback;
	}
}
