#include "cancelio/blocking/tcp.hpp"

#include "socket_helpers.hpp"

#include <cerrno>
#include <sys/socket.h>
#include <utility>

namespace cancelio::blocking {

namespace {

result<fd_stream> open_tcp_socket() noexcept {
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return err<fd_stream>(error::from_errno());
    }
    return fd_stream{fd};
}

} // namespace

tcp_stream::tcp_stream(fd_stream socket) noexcept : socket_(std::move(socket)) {}

result<tcp_stream> tcp_stream::connect(const endpoint& remote) noexcept {
    const auto addr = detail::to_sockaddr(remote);
    if (!addr.has_value()) {
        return err<tcp_stream>(addr.error());
    }

    auto socket = open_tcp_socket();
    if (!socket.has_value()) {
        return err<tcp_stream>(socket.error());
    }

    if (::connect(socket->native_handle(),
                  reinterpret_cast<const sockaddr*>(&addr.value()),
                  sizeof(sockaddr_in)) != 0) {
        return err<tcp_stream>(error::from_errno());
    }

    return tcp_stream{std::move(socket.value())};
}

result<std::size_t> tcp_stream::read(std::span<std::byte> buffer) noexcept {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }
    if (buffer.empty()) {
        return static_cast<std::size_t>(0);
    }

    const ssize_t read_count =
        ::recv(socket_.native_handle(), buffer.data(), buffer.size(), 0);
    if (read_count < 0) {
        return err<std::size_t>(error::from_errno());
    }
    return static_cast<std::size_t>(read_count);
}

result<std::size_t>
tcp_stream::write(std::span<const std::byte> buffer) noexcept {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }
    if (buffer.empty()) {
        return static_cast<std::size_t>(0);
    }

    const ssize_t write_count = ::send(socket_.native_handle(), buffer.data(),
                                       buffer.size(), MSG_NOSIGNAL);
    if (write_count < 0) {
        return err<std::size_t>(error::from_errno());
    }
    return static_cast<std::size_t>(write_count);
}

result<void> tcp_stream::flush() noexcept {
    if (!valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }
    return ok();
}

result<void> tcp_stream::shutdown_write() noexcept {
    if (!valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }
    if (::shutdown(socket_.native_handle(), SHUT_WR) == 0) {
        return ok();
    }
    return err<void>(error::from_errno());
}

result<void>
tcp_stream::set_read_timeout(std::chrono::milliseconds timeout) noexcept {
    if (!valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }
    return detail::set_timeout(socket_.native_handle(), SO_RCVTIMEO, timeout);
}

result<endpoint> tcp_stream::peer_endpoint() const {
    if (!valid()) {
        return err<endpoint>(make_error_from_errno(EBADF));
    }

    sockaddr_in addr{};
    auto addr_len = static_cast<socklen_t>(sizeof(addr));
    if (::getpeername(socket_.native_handle(), reinterpret_cast<sockaddr*>(&addr),
                      &addr_len) != 0) {
        return err<endpoint>(error::from_errno());
    }
    return detail::from_sockaddr(addr);
}

int tcp_stream::native_handle() const noexcept {
    return socket_.native_handle();
}

bool tcp_stream::valid() const noexcept {
    return socket_.valid();
}

tcp_listener::tcp_listener(fd_stream socket) noexcept
    : socket_(std::move(socket)) {}

result<tcp_listener> tcp_listener::bind(const endpoint& local,
                                        int backlog) noexcept {
    const auto addr = detail::to_sockaddr(local);
    if (!addr.has_value()) {
        return err<tcp_listener>(addr.error());
    }

    auto socket = open_tcp_socket();
    if (!socket.has_value()) {
        return err<tcp_listener>(socket.error());
    }

    const int fd = socket->native_handle();
    if (auto reuse = detail::set_reuse_addr(fd); !reuse.has_value()) {
        return err<tcp_listener>(reuse.error());
    }
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr.value()),
               sizeof(sockaddr_in)) != 0) {
        return err<tcp_listener>(error::from_errno());
    }
    if (::listen(fd, backlog) != 0) {
        return err<tcp_listener>(error::from_errno());
    }

    return tcp_listener{std::move(socket.value())};
}

result<tcp_stream> tcp_listener::accept() noexcept {
    if (!valid()) {
        return err<tcp_stream>(make_error_from_errno(EBADF));
    }

    const int accepted =
        ::accept4(socket_.native_handle(), nullptr, nullptr, SOCK_CLOEXEC);
    if (accepted < 0) {
        return err<tcp_stream>(error::from_errno());
    }
    return tcp_stream{fd_stream{accepted}};
}

result<std::uint16_t> tcp_listener::local_port() const noexcept {
    if (!valid()) {
        return err<std::uint16_t>(make_error_from_errno(EBADF));
    }

    sockaddr_in addr{};
    auto addr_len = static_cast<socklen_t>(sizeof(addr));
    if (::getsockname(socket_.native_handle(), reinterpret_cast<sockaddr*>(&addr),
                      &addr_len) != 0) {
        return err<std::uint16_t>(error::from_errno());
    }
    return ntohs(addr.sin_port);
}

int tcp_listener::native_handle() const noexcept {
    return socket_.native_handle();
}

bool tcp_listener::valid() const noexcept {
    return socket_.valid();
}

} // namespace cancelio::blocking
