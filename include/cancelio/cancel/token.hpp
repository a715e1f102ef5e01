#pragma once

/**
 * @file
 * @brief Shared, thread-safe, one-way cancellation flag.
 */

#include "cancelio/core/result.hpp"

#include <atomic>
#include <compare>
#include <cstddef>
#include <functional>
#include <memory>

namespace cancelio {

/**
 * @brief Cooperative cancellation signal shared by value.
 *
 * Every copy refers to the same flag; cancelling any copy cancels them all.
 * Copies compare equal, hash identically and order by the address of the
 * shared flag, so a token doubles as a cheap identifier for an
 * interruptible operation. The flag only ever goes from "live" to
 * "cancelled".
 *
 * Accesses use relaxed ordering: the flag publishes no other data.
 */
class cancellation_token {
public:
    /// Construct a fresh token in the non-cancelled state.
    cancellation_token();

    /**
     * @brief Mark the token, and every copy of it, as cancelled.
     *
     * Idempotent and safe to call concurrently from any thread.
     */
    void cancel() const noexcept;

    /**
     * @brief Checkpoint used before every cancellable operation.
     * @return Success while live, `error::cancelled()` afterwards.
     */
    [[nodiscard]] result<void> check() const noexcept {
        if (is_cancelled()) {
            return err<void>(error::cancelled());
        }
        return ok();
    }

    /// @return `true` once `cancel()` has been called on any copy.
    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_ != nullptr && state_->load(std::memory_order_relaxed);
    }

    /// @return Identity hash of the shared flag.
    [[nodiscard]] std::size_t hash() const noexcept {
        return std::hash<const void*>{}(state_.get());
    }

    friend bool operator==(const cancellation_token& lhs,
                           const cancellation_token& rhs) noexcept {
        return lhs.state_ == rhs.state_;
    }

    friend std::strong_ordering operator<=>(const cancellation_token& lhs,
                                            const cancellation_token& rhs) noexcept {
        return std::compare_three_way{}(lhs.state_.get(), rhs.state_.get());
    }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace cancelio

template <>
struct std::hash<cancelio::cancellation_token> {
    std::size_t operator()(const cancelio::cancellation_token& token) const noexcept {
        return token.hash();
    }
};
