#pragma once

#include "cancelio/blocking/endpoint.hpp"
#include "cancelio/core/result.hpp"

#include <chrono>
#include <netinet/in.h>

namespace cancelio::blocking::detail {

[[nodiscard]] result<sockaddr_in> to_sockaddr(const endpoint& ep) noexcept;
[[nodiscard]] result<endpoint> from_sockaddr(const sockaddr_in& addr);
[[nodiscard]] result<void> set_reuse_addr(int fd) noexcept;
/// `option` is `SO_RCVTIMEO` or `SO_SNDTIMEO`; zero disables the timeout.
[[nodiscard]] result<void> set_timeout(int fd, int option,
                                       std::chrono::microseconds timeout) noexcept;

} // namespace cancelio::blocking::detail
