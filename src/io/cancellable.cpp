#include "cancelio/io/cancellable.hpp"

#include "cancelio/core/log.hpp"

namespace cancelio::detail {

void log_refused(std::string_view operation,
                 const cancellation_token& token) noexcept {
    log::logger().debug("{} refused, token {:#x} is cancelled", operation,
                        token.hash());
}

} // namespace cancelio::detail
