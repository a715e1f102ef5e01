#include "socket_helpers.hpp"

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <sys/socket.h>
#include <sys/time.h>

namespace cancelio::blocking::detail {

result<sockaddr_in> to_sockaddr(const endpoint& ep) noexcept {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = ::htons(ep.port);

    if (::inet_pton(AF_INET, ep.host.c_str(), &addr.sin_addr) == 1) {
        return addr;
    }
    return err<sockaddr_in>(make_error_from_errno(EINVAL));
}

result<endpoint> from_sockaddr(const sockaddr_in& addr) {
    std::array<char, INET_ADDRSTRLEN> text{};
    if (::inet_ntop(AF_INET, &addr.sin_addr, text.data(), text.size()) ==
        nullptr) {
        return err<endpoint>(error::from_errno());
    }
    return endpoint{.host = std::string{text.data()},
                    .port = ntohs(addr.sin_port)};
}

result<void> set_reuse_addr(int fd) noexcept {
    int enabled = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enabled, sizeof(enabled)) ==
        0) {
        return ok();
    }
    return err<void>(error::from_errno());
}

result<void> set_timeout(int fd, int option,
                         std::chrono::microseconds timeout) noexcept {
    if (timeout.count() < 0) {
        return err<void>(make_error_from_errno(EINVAL));
    }

    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1'000'000);
    tv.tv_usec = static_cast<suseconds_t>(timeout.count() % 1'000'000);
    if (::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) == 0) {
        return ok();
    }
    return err<void>(error::from_errno());
}

} // namespace cancelio::blocking::detail
