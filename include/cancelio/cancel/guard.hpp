#pragma once

/**
 * @file
 * @brief Scope-bound owner that cancels its token on destruction.
 */

#include "cancelio/cancel/token.hpp"

namespace cancelio {

/**
 * @brief Cancels the owned token when the enclosing scope ends.
 *
 * Workers holding copies of `token()` stop at their next checkpoint once
 * the guard is gone, whether the scope returned normally or unwound.
 */
class cancellation_guard {
public:
    /// Take ownership of `token`.
    explicit cancellation_guard(cancellation_token token) noexcept;
    /// Cancel the owned token.
    ~cancellation_guard();

    cancellation_guard(const cancellation_guard&) = delete;
    cancellation_guard& operator=(const cancellation_guard&) = delete;
    cancellation_guard(cancellation_guard&&) = delete;
    cancellation_guard& operator=(cancellation_guard&&) = delete;

    /// @return The guarded token; copy it to hand it to workers.
    [[nodiscard]] const cancellation_token& token() const noexcept;

private:
    cancellation_token token_;
};

} // namespace cancelio
