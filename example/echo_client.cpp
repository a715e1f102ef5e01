#include "cancelio/cancelio.hpp"

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using namespace std::chrono_literals;

std::vector<std::byte> to_bytes(std::string_view value) {
    std::vector<std::byte> bytes;
    bytes.reserve(value.size());
    for (const char ch : value) {
        bytes.push_back(static_cast<std::byte>(ch));
    }
    return bytes;
}

std::optional<unsigned long> parse_number(const char* argument) {
    try {
        std::size_t consumed = 0;
        const auto text = std::string{argument};
        const auto parsed = std::stoul(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/// Reads one echoed payload, retrying receive timeouts so a cancel is seen.
cancelio::result<void>
read_echo(cancelio::cancellable<cancelio::blocking::tcp_stream>& client,
          std::span<std::byte> response) {
    std::size_t filled = 0;
    while (filled < response.size()) {
        auto count = client.read(response.subspan(filled));
        if (!count.has_value()) {
            const int code = count.error().value();
            if (!count.error().is_cancelled() &&
                (code == EAGAIN || code == EWOULDBLOCK || code == EINTR)) {
                continue;
            }
            return cancelio::err<void>(count.error());
        }
        if (count.value() == 0U) {
            return cancelio::err<void>(cancelio::errc::unexpected_eof);
        }
        filled += count.value();
    }
    return cancelio::ok();
}

/// Runs the echo loop until `rounds` complete or the token is cancelled.
cancelio::result<unsigned long> run_rounds(cancelio::blocking::tcp_stream socket,
                                           cancelio::cancellation_token token,
                                           const std::vector<std::byte>& payload,
                                           unsigned long rounds) {
    if (auto timeout = socket.set_read_timeout(200ms); !timeout.has_value()) {
        return cancelio::err<unsigned long>(timeout.error());
    }

    cancelio::cancellable<cancelio::blocking::tcp_stream> client{std::move(socket),
                                                                 std::move(token)};
    std::vector<std::byte> response(payload.size());
    unsigned long completed = 0;
    for (; completed < rounds; ++completed) {
        if (auto sent = client.write_all(payload); !sent.has_value()) {
            return cancelio::err<unsigned long>(sent.error());
        }
        if (auto echoed = read_echo(client, response); !echoed.has_value()) {
            return cancelio::err<unsigned long>(echoed.error());
        }
        if (response != payload) {
            return cancelio::err<unsigned long>(
                cancelio::make_error_from_errno(EPROTO));
        }
    }
    return completed;
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 6) {
        std::cerr << "usage: cancelio_echo_client [host] [port] [payload] [rounds] "
                     "[deadline_ms]\n";
        return 2;
    }

    cancelio::log::init_from_env();

    const std::string host = argc > 1 ? argv[1] : "127.0.0.1";
    std::uint16_t port = 8080;
    if (argc > 2) {
        const auto parsed = parse_number(argv[2]);
        if (!parsed.has_value() || parsed.value() == 0U || parsed.value() > 65535U) {
            std::cerr << "port must be in range [1, 65535]\n";
            return 2;
        }
        port = static_cast<std::uint16_t>(parsed.value());
    }
    const std::string payload = argc > 3 ? argv[3] : "hello cancelio";
    unsigned long rounds = 10;
    if (argc > 4) {
        const auto parsed = parse_number(argv[4]);
        if (!parsed.has_value()) {
            std::cerr << "invalid rounds argument\n";
            return 2;
        }
        rounds = parsed.value();
    }
    std::chrono::milliseconds deadline{5000};
    if (argc > 5) {
        const auto parsed = parse_number(argv[5]);
        if (!parsed.has_value()) {
            std::cerr << "invalid deadline argument\n";
            return 2;
        }
        deadline = std::chrono::milliseconds{static_cast<std::int64_t>(parsed.value())};
    }

    auto client_result = cancelio::blocking::tcp_stream::connect(
        cancelio::blocking::endpoint{host, port});
    if (!client_result.has_value()) {
        std::cerr << "connect failed: " << client_result.error().message() << '\n';
        return 1;
    }

    std::future<cancelio::result<unsigned long>> worker;
    {
        // Leaving this scope cancels the worker's token.
        const cancelio::cancellation_guard guard{cancelio::cancellation_token{}};
        worker = std::async(std::launch::async, run_rounds,
                            std::move(client_result.value()), guard.token(),
                            to_bytes(payload), rounds);
        if (worker.wait_for(deadline) == std::future_status::timeout) {
            std::cerr << "deadline reached, cancelling\n";
        }
    }

    const auto outcome = worker.get();
    if (!outcome.has_value()) {
        if (outcome.error().is_cancelled()) {
            std::cerr << "echo cancelled\n";
            return 3;
        }
        std::cerr << "echo failed: " << outcome.error().message() << '\n';
        return 1;
    }

    std::cout << "completed " << outcome.value() << " rounds to "
              << cancelio::blocking::endpoint{host, port}.to_string() << '\n';
    return 0;
}
