#include "cancelio/blocking/tcp.hpp"
#include "cancelio/cancel/guard.hpp"
#include "cancelio/cancel/token.hpp"
#include "cancelio/io/cancellable.hpp"
#include "cancelio/io/stream_ops.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <future>
#include <gtest/gtest.h>
#include <span>
#include <thread>
#include <utility>
#include <vector>

namespace {

using namespace std::chrono_literals;

/// Connected client/server pair on loopback.
struct tcp_pair {
    cancelio::blocking::tcp_stream client;
    cancelio::blocking::tcp_stream server;
};

tcp_pair connect_pair() {
    auto listener_result = cancelio::blocking::tcp_listener::bind(
        cancelio::blocking::endpoint::loopback(0));
    EXPECT_TRUE(listener_result.has_value()) << listener_result.error().message();
    auto listener = std::move(listener_result.value());

    auto port_result = listener.local_port();
    EXPECT_TRUE(port_result.has_value()) << port_result.error().message();

    auto client_result = cancelio::blocking::tcp_stream::connect(
        cancelio::blocking::endpoint::loopback(port_result.value()));
    EXPECT_TRUE(client_result.has_value()) << client_result.error().message();

    auto accepted_result = listener.accept();
    EXPECT_TRUE(accepted_result.has_value()) << accepted_result.error().message();

    return tcp_pair{std::move(client_result.value()),
                    std::move(accepted_result.value())};
}

TEST(blocking_tcp_test, echo_round_trip_through_cancellable_streams) {
    auto [client_socket, server_socket] = connect_pair();
    const cancelio::cancellation_token token;

    std::promise<cancelio::result<void>> server_promise;
    auto server_future = server_promise.get_future();
    std::thread server_thread([&server_socket, copy = token,
                               promise = std::move(server_promise)]() mutable {
        cancelio::cancellable<cancelio::blocking::tcp_stream&> server{server_socket,
                                                                     copy};
        std::array<std::byte, 11> payload{};
        const auto read_status = server.read_exact(payload);
        if (!read_status.has_value()) {
            promise.set_value(read_status);
            return;
        }
        promise.set_value(server.write_all(payload));
    });

    cancelio::cancellable<cancelio::blocking::tcp_stream> client{
        std::move(client_socket), token};
    const std::array<std::byte, 11> request{
        static_cast<std::byte>('h'), static_cast<std::byte>('e'),
        static_cast<std::byte>('l'), static_cast<std::byte>('l'),
        static_cast<std::byte>('o'), static_cast<std::byte>('-'),
        static_cast<std::byte>('w'), static_cast<std::byte>('o'),
        static_cast<std::byte>('r'), static_cast<std::byte>('l'),
        static_cast<std::byte>('d'),
    };

    const auto write_status = client.write_all(request);
    ASSERT_TRUE(write_status.has_value()) << write_status.error().message();

    std::array<std::byte, 11> response{};
    const auto read_status = client.read_exact(response);
    ASSERT_TRUE(read_status.has_value()) << read_status.error().message();

    const auto server_status = server_future.get();
    server_thread.join();

    ASSERT_TRUE(server_status.has_value()) << server_status.error().message();
    EXPECT_EQ(response, request);
}

TEST(blocking_tcp_test, timed_reads_notice_cancel_from_another_thread) {
    auto [client_socket, server_socket] = connect_pair();
    ASSERT_TRUE(server_socket.set_read_timeout(20ms).has_value());

    const cancelio::cancellation_token token;
    std::atomic<int> timeouts{0};

    auto reader = std::async(std::launch::async, [&server_socket, &timeouts,
                                                  copy = token]() {
        cancelio::cancellable<cancelio::blocking::tcp_stream&> stream{server_socket,
                                                                     copy};
        std::array<std::byte, 64> buffer{};
        for (;;) {
            auto count = stream.read(buffer);
            if (count.has_value()) {
                if (count.value() == 0U) {
                    return cancelio::ok();
                }
                continue;
            }
            const int code = count.error().value();
            if (!count.error().is_cancelled() && (code == EAGAIN || code == EWOULDBLOCK)) {
                timeouts.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            return cancelio::err<void>(count.error());
        }
    });

    while (timeouts.load(std::memory_order_relaxed) == 0) {
        std::this_thread::sleep_for(5ms);
    }
    token.cancel();

    ASSERT_EQ(reader.wait_for(5s), std::future_status::ready);
    const auto status = reader.get();
    ASSERT_FALSE(status.has_value());
    EXPECT_TRUE(status.error().is_cancelled());
    EXPECT_TRUE(client_socket.valid());
}

TEST(blocking_tcp_test, cancelled_writer_sends_nothing) {
    auto [client_socket, server_socket] = connect_pair();

    std::vector<std::byte> received;
    {
        const cancelio::cancellation_guard guard{cancelio::cancellation_token{}};
        cancelio::cancellable<cancelio::blocking::tcp_stream> client{
            std::move(client_socket), guard.token()};

        const std::array<std::byte, 2> first{std::byte{'o'}, std::byte{'k'}};
        ASSERT_TRUE(client.write_all(first).has_value());

        guard.token().cancel();
        const std::array<std::byte, 4> late{std::byte{'l'}, std::byte{'a'},
                                            std::byte{'t'}, std::byte{'e'}};
        const auto late_status = client.write_all(late);
        ASSERT_FALSE(late_status.has_value());
        EXPECT_TRUE(late_status.error().is_cancelled());

        ASSERT_TRUE(client.get_mut().shutdown_write().has_value());
    }

    const auto count = cancelio::io::read_to_end(server_socket, received);
    ASSERT_TRUE(count.has_value()) << count.error().message();
    EXPECT_EQ(received, (std::vector<std::byte>{std::byte{'o'}, std::byte{'k'}}));
}

TEST(blocking_tcp_test, peer_endpoint_reports_loopback) {
    auto [client_socket, server_socket] = connect_pair();

    const auto peer = client_socket.peer_endpoint();
    ASSERT_TRUE(peer.has_value()) << peer.error().message();
    EXPECT_EQ(peer.value().host, "127.0.0.1");
    EXPECT_NE(peer.value().port, 0U);
    EXPECT_TRUE(server_socket.valid());
}

} // namespace
