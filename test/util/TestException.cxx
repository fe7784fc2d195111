// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "util/Exception.hxx"
#include "util/PrintException.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(ExceptionTest, RuntimeError)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(std::runtime_error("Foo"))), "Foo");
}

TEST(ExceptionTest, DerivedError)
{
	class DerivedError : public std::invalid_argument {
	public:
		explicit DerivedError(const char *_msg)
			:std::invalid_argument(_msg) {}
	};

	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(DerivedError("Foo"))), "Foo");
}

TEST(ExceptionTest, Nested)
{
	try {
		try {
			throw std::out_of_range("Timestamp out of range");
		} catch (...) {
			std::throw_with_nested(std::runtime_error("Failed to decode"));
		}
	} catch (...) {
		ASSERT_EQ(GetFullMessage(std::current_exception()),
			  "Failed to decode; Timestamp out of range");
		ASSERT_EQ(GetFullMessage(std::current_exception(), "?", ": "),
			  "Failed to decode: Timestamp out of range");
	}
}

TEST(ExceptionTest, Unknown)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(42)), "Unknown exception");
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(42), "Oops"), "Oops");
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr("Foo")), "Foo");
}

TEST(ExceptionTest, Print)
{
	testing::internal::CaptureStderr();
	try {
		try {
			throw std::invalid_argument("Malformed hex digit");
		} catch (...) {
			std::throw_with_nested(std::runtime_error("Failed to decode"));
		}
	} catch (...) {
		PrintException(std::current_exception());
	}
	PrintException(std::make_exception_ptr(42));
	EXPECT_EQ(testing::internal::GetCapturedStderr(),
		  "Failed to decode\n"
		  "Malformed hex digit\n"
		  "Unrecognized exception\n");
}
