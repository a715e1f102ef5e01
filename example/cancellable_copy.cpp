#include "cancelio/cancelio.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>

namespace {

/**
 * @brief Cancels a token unless `finish` is called before the deadline.
 */
class watchdog {
public:
    watchdog(cancelio::cancellation_token token, std::chrono::milliseconds deadline)
        : thread_([this, token = std::move(token), deadline]() {
              std::unique_lock lock{mutex_};
              if (!done_cv_.wait_for(lock, deadline, [this] { return done_; })) {
                  cancelio::log::logger().warn("deadline of {} ms reached, cancelling",
                                               deadline.count());
                  token.cancel();
              }
          }) {}

    ~watchdog() {
        finish();
    }

    watchdog(const watchdog&) = delete;
    watchdog& operator=(const watchdog&) = delete;

    void finish() {
        {
            const std::lock_guard lock{mutex_};
            done_ = true;
        }
        done_cv_.notify_one();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    std::mutex mutex_;
    std::condition_variable done_cv_;
    bool done_{false};
    std::thread thread_;
};

cancelio::result<cancelio::blocking::fd_stream> open_stdin() {
    const int fd = ::dup(STDIN_FILENO);
    if (fd < 0) {
        return cancelio::err<cancelio::blocking::fd_stream>(
            cancelio::error::from_errno());
    }
    return cancelio::blocking::fd_stream{fd};
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "usage: cancelio_copy <path|-> [deadline_ms]\n";
        return 2;
    }

    cancelio::log::init_from_env();

    std::chrono::milliseconds deadline{1000};
    if (argc > 2) {
        try {
            std::size_t consumed = 0;
            const auto text = std::string{argv[2]};
            const auto parsed = std::stoull(text, &consumed);
            if (consumed != text.size()) {
                std::cerr << "invalid deadline argument\n";
                return 2;
            }
            deadline = std::chrono::milliseconds{static_cast<std::int64_t>(parsed)};
        } catch (const std::exception&) {
            std::cerr << "invalid deadline argument\n";
            return 2;
        }
    }

    const std::string path = argv[1];
    auto file_result =
        path == "-" ? open_stdin()
                    : cancelio::blocking::fd_stream::open(
                          path, cancelio::blocking::open_mode::read_only);
    if (!file_result.has_value()) {
        std::cerr << "open failed: " << file_result.error().message() << '\n';
        return 1;
    }

    const cancelio::cancellation_token token;
    cancelio::cancellable<cancelio::io::buffered_reader<cancelio::blocking::fd_stream>>
        source{cancelio::io::buffered_reader<cancelio::blocking::fd_stream>{
                   std::move(file_result.value())},
               token};
    cancelio::blocking::fd_stream sink{::dup(STDOUT_FILENO)};
    if (!sink.valid()) {
        std::cerr << "dup failed: " << cancelio::error::from_errno().message() << '\n';
        return 1;
    }

    watchdog guard_timer{token, deadline};
    const auto copied = cancelio::io::copy(source, sink);
    guard_timer.finish();

    if (!copied.has_value()) {
        if (copied.error().is_cancelled()) {
            std::cerr << "copy cancelled\n";
            return 3;
        }
        std::cerr << "copy failed: " << copied.error().message() << '\n';
        return 1;
    }

    cancelio::log::logger().info("copied {} bytes", copied.value());
    return 0;
}
