#include "cancelio/core/result.hpp"

#include <cerrno>
#include <gtest/gtest.h>

namespace {

cancelio::result<int> parse_positive(int value) {
    if (value > 0) {
        return value;
    }
    return cancelio::err<int>(cancelio::make_error_from_errno(EINVAL));
}

cancelio::result<int> half_of(int value) {
    auto parsed = parse_positive(value);
    if (!parsed.has_value()) {
        return cancelio::err<int>(parsed.error());
    }
    return parsed.value() / 2;
}

TEST(result_test, stores_success_value) {
    const auto value = parse_positive(7);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 7);
}

TEST(result_test, stores_failure_value) {
    const auto value = parse_positive(0);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().value(), EINVAL);
}

TEST(result_test, propagates_failure_unchanged) {
    const auto value = half_of(-3);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().value(), EINVAL);
    EXPECT_EQ(half_of(8).value(), 4);
}

TEST(result_test, builds_error_from_library_code) {
    const auto value = cancelio::err<void>(cancelio::errc::cancelled);
    ASSERT_FALSE(value.has_value());
    EXPECT_TRUE(value.error().is_cancelled());
}

TEST(result_test, supports_void_success_result) {
    const auto value = cancelio::ok();
    EXPECT_TRUE(value.has_value());
}

} // namespace
