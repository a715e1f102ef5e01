#pragma once

/**
 * @file
 * @brief Blocking TCP stream and listener.
 */

#include "cancelio/blocking/endpoint.hpp"
#include "cancelio/blocking/fd_stream.hpp"
#include "cancelio/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>

namespace cancelio::blocking {

/**
 * @brief Blocking TCP connected socket.
 *
 * Readable and writable, so it can be wrapped in `cancellable`. A receive
 * timeout bounds how long one `read` may block, which in turn bounds how
 * late a wrapper notices cancellation.
 */
class tcp_stream {
public:
    /// Construct an empty stream.
    tcp_stream() noexcept = default;
    /// Construct from an already-open connected socket.
    explicit tcp_stream(fd_stream socket) noexcept;

    tcp_stream(const tcp_stream&) = delete;
    tcp_stream& operator=(const tcp_stream&) = delete;
    tcp_stream(tcp_stream&&) noexcept = default;
    tcp_stream& operator=(tcp_stream&&) noexcept = default;

    /**
     * @brief Connect to a remote endpoint.
     * @param remote Remote host/port.
     */
    [[nodiscard]] static result<tcp_stream>
    connect(const endpoint& remote) noexcept;

    /**
     * @brief Receive up to `buffer.size()` bytes.
     * @return Number of bytes read, or 0 on peer shutdown. A receive
     *         timeout surfaces as `EAGAIN`.
     */
    [[nodiscard]] result<std::size_t> read(std::span<std::byte> buffer) noexcept;
    /**
     * @brief Send up to `buffer.size()` bytes without raising `SIGPIPE`.
     * @return Number of bytes written.
     */
    [[nodiscard]] result<std::size_t>
    write(std::span<const std::byte> buffer) noexcept;
    /// @brief Nothing is buffered in user space.
    [[nodiscard]] result<void> flush() noexcept;
    /// @brief Shutdown the write half of the connection.
    [[nodiscard]] result<void> shutdown_write() noexcept;

    /**
     * @brief Limit how long a single `read` blocks (`SO_RCVTIMEO`).
     * @param timeout Zero removes the limit.
     */
    [[nodiscard]] result<void>
    set_read_timeout(std::chrono::milliseconds timeout) noexcept;

    /// @return Address of the connected peer.
    [[nodiscard]] result<endpoint> peer_endpoint() const;

    /// @return Native socket descriptor.
    [[nodiscard]] int native_handle() const noexcept;
    /// @return `true` when a valid socket is owned.
    [[nodiscard]] bool valid() const noexcept;

private:
    fd_stream socket_;
};

/**
 * @brief Blocking TCP listening socket.
 */
class tcp_listener {
public:
    /// Construct an empty listener.
    tcp_listener() noexcept = default;
    /// Construct from an already-open listening socket.
    explicit tcp_listener(fd_stream socket) noexcept;

    tcp_listener(const tcp_listener&) = delete;
    tcp_listener& operator=(const tcp_listener&) = delete;
    tcp_listener(tcp_listener&&) noexcept = default;
    tcp_listener& operator=(tcp_listener&&) noexcept = default;

    /**
     * @brief Bind and listen on a local endpoint.
     * @param local Local host/port.
     * @param backlog Kernel listen backlog.
     */
    [[nodiscard]] static result<tcp_listener> bind(const endpoint& local,
                                                   int backlog = 128) noexcept;
    /**
     * @brief Accept a single incoming connection.
     * @return Connected stream socket.
     */
    [[nodiscard]] result<tcp_stream> accept() noexcept;
    /// @return Bound local port number.
    [[nodiscard]] result<std::uint16_t> local_port() const noexcept;

    /// @return Native listening socket descriptor.
    [[nodiscard]] int native_handle() const noexcept;
    /// @return `true` when a valid socket is owned.
    [[nodiscard]] bool valid() const noexcept;

private:
    fd_stream socket_;
};

} // namespace cancelio::blocking
