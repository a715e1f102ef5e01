#include "cancelio/cancel/guard.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>

namespace {

TEST(cancellation_guard_test, cancels_token_when_scope_ends) {
    std::optional<cancelio::cancellation_token> observer;
    {
        const cancelio::cancellation_guard guard{cancelio::cancellation_token{}};
        observer = guard.token();
        EXPECT_FALSE(observer->is_cancelled());
    }

    ASSERT_TRUE(observer.has_value());
    EXPECT_TRUE(observer->is_cancelled());
}

TEST(cancellation_guard_test, cancels_on_early_return) {
    const cancelio::cancellation_token token;
    const auto handler = [&token](bool bail_out) {
        const cancelio::cancellation_guard guard{token};
        if (bail_out) {
            return 1;
        }
        return 2;
    };

    EXPECT_EQ(handler(true), 1);
    EXPECT_TRUE(token.is_cancelled());
}

TEST(cancellation_guard_test, cancels_during_exception_unwinding) {
    const cancelio::cancellation_token token;

    EXPECT_THROW(
        {
            const cancelio::cancellation_guard guard{token};
            throw std::runtime_error("handler failed");
        },
        std::runtime_error);

    EXPECT_TRUE(token.is_cancelled());
}

TEST(cancellation_guard_test, tolerates_token_already_cancelled) {
    const cancelio::cancellation_token token;
    {
        const cancelio::cancellation_guard guard{token};
        token.cancel();
    }
    EXPECT_TRUE(token.is_cancelled());
}

TEST(cancellation_guard_test, exposes_the_owned_token) {
    const cancelio::cancellation_token token;
    const cancelio::cancellation_guard guard{token};

    EXPECT_EQ(guard.token(), token);
    EXPECT_FALSE(guard.token().is_cancelled());
}

} // namespace
