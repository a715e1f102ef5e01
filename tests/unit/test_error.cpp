#include "cancelio/core/error.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <system_error>

namespace {

TEST(error_test, maps_common_errno_values) {
    const auto retry = cancelio::make_error_from_errno(EAGAIN);
    const auto pipe = cancelio::make_error_from_errno(EPIPE);

    EXPECT_EQ(retry.value(), EAGAIN);
    EXPECT_EQ(pipe.value(), EPIPE);
    EXPECT_EQ(pipe.code().category(), std::system_category());
    EXPECT_FALSE(pipe.is_cancelled());
}

TEST(error_test, uses_current_errno_by_default) {
    errno = ETIMEDOUT;
    const auto value = cancelio::error::from_errno();

    EXPECT_EQ(value.value(), ETIMEDOUT);
    EXPECT_FALSE(value.message().empty());
}

TEST(error_test, cancellation_reads_as_broken_pipe_to_generic_handlers) {
    const auto cancelled = cancelio::error::cancelled();

    EXPECT_TRUE(cancelled.is_cancelled());
    EXPECT_EQ(cancelled.code(), std::errc::broken_pipe);
    EXPECT_EQ(cancelled.code(), cancelio::errc::cancelled);
    EXPECT_STREQ(cancelled.code().category().name(), "cancelio");
    EXPECT_NE(cancelled.message().find("cancelled"), std::string::npos);
}

TEST(error_test, real_broken_pipe_matches_the_same_condition) {
    const auto pipe = cancelio::make_error_from_errno(EPIPE);
    const auto cancelled = cancelio::error::cancelled();

    EXPECT_EQ(pipe.code().default_error_condition(),
              cancelled.code().default_error_condition());
    EXPECT_NE(pipe.code(), cancelled.code());
}

TEST(error_test, library_codes_have_distinct_messages) {
    const cancelio::error eof{cancelio::errc::unexpected_eof};
    const cancelio::error zero{cancelio::errc::write_zero};

    EXPECT_NE(eof.message(), zero.message());
    EXPECT_NE(eof.code(), std::errc::broken_pipe);
    EXPECT_FALSE(eof.is_cancelled());
}

TEST(error_test, default_constructed_error_is_empty) {
    const cancelio::error empty;
    EXPECT_EQ(empty.value(), 0);
    EXPECT_FALSE(static_cast<bool>(empty.code()));
}

} // namespace
