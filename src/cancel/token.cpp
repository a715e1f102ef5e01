#include "cancelio/cancel/token.hpp"

#include "cancelio/core/log.hpp"

namespace cancelio {

cancellation_token::cancellation_token()
    : state_(std::make_shared<std::atomic<bool>>(false)) {}

void cancellation_token::cancel() const noexcept {
    if (state_ == nullptr) {
        return;
    }
    if (!state_->exchange(true, std::memory_order_relaxed)) {
        log::logger().debug("token {} cancelled",
                            static_cast<const void*>(state_.get()));
    }
}

} // namespace cancelio
