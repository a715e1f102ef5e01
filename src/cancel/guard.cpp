#include "cancelio/cancel/guard.hpp"

#include "cancelio/core/log.hpp"

#include <utility>

namespace cancelio {

cancellation_guard::cancellation_guard(cancellation_token token) noexcept
    : token_(std::move(token)) {}

cancellation_guard::~cancellation_guard() {
    log::logger().trace("guard releasing token {:#x}", token_.hash());
    token_.cancel();
}

const cancellation_token& cancellation_guard::token() const noexcept {
    return token_;
}

} // namespace cancelio
