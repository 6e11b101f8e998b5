#include "skyup/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace skyup;

namespace {

Result<int> parse_digit(char c) {
    if (c < '0' || c > '9') {
        return Err<int>(invalid_argument(std::string("not a digit: ") + c));
    }
    return Ok(c - '0');
}

Result<std::string> describe_digit(char c) {
    auto digit = parse_digit(c);
    if (digit.is_error()) {
        return digit.error_as<std::string>();
    }
    return Ok(std::to_string(digit.value() * 2));
}

Result<void> check_digit(char c) {
    auto digit = parse_digit(c);
    if (digit.is_error()) {
        return digit.error_as<void>();
    }
    return Ok();
}

} // namespace

TEST(ResultTest, OkAndErrAreDistinct) {
    auto ok = parse_digit('7');
    ASSERT_TRUE(ok.is_ok());
    EXPECT_FALSE(ok.is_error());
    EXPECT_EQ(ok.value(), 7);

    auto bad = parse_digit('x');
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(bad.value_or(-1), -1);
}

TEST(ResultTest, ErrorAsKeepsTheError) {
    auto doubled = describe_digit('4');
    ASSERT_TRUE(doubled.is_ok());
    EXPECT_EQ(doubled.value(), "8");

    auto forwarded = describe_digit('?');
    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(forwarded.error().message, "not a digit: ?");
}

TEST(ResultTest, ErrorAsIntoAndOutOfVoid) {
    EXPECT_TRUE(check_digit('1').is_ok());

    auto checked = check_digit('a');
    ASSERT_TRUE(checked.is_error());
    EXPECT_EQ(checked.error().message, "not a digit: a");

    Result<void> failed = Err<void>(transport_error("reset", true));
    auto as_int = failed.error_as<int>();
    ASSERT_TRUE(as_int.is_error());
    EXPECT_EQ(as_int.error().code, ErrorCode::TransportError);
    EXPECT_TRUE(as_int.error().transient);
}
