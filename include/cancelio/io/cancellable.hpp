#pragma once

/**
 * @file
 * @brief Decorator that makes any blocking stream cooperatively cancellable.
 */

#include "cancelio/cancel/token.hpp"
#include "cancelio/core/result.hpp"
#include "cancelio/io/concepts.hpp"
#include "cancelio/io/seek.hpp"
#include "cancelio/io/stream_ops.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace cancelio {

namespace detail {

/// @brief Record that `operation` was refused by a cancelled token.
void log_refused(std::string_view operation,
                 const cancellation_token& token) noexcept;

} // namespace detail

/**
 * @brief Owns a stream and checks a cancellation token before each call.
 *
 * Every operation the inner type supports is exposed; each one checks the
 * token first and, if it is cancelled, returns `error::cancelled()` without
 * touching the inner stream or the caller's buffers. Otherwise the inner
 * result is returned unchanged. `consume` is the only unchecked operation.
 *
 * The check happens at entry only. A delegated call that is already
 * blocked runs to completion, so the cancellation latency is bounded by
 * the duration of one underlying call, which depends on how the inner
 * stream chunks its work.
 *
 * @tparam T Wrapped stream, held by value. An lvalue reference type wraps
 *           a stream the caller keeps owning.
 */
template <class T>
class cancellable {
public:
    /**
     * @brief Wrap `inner`, checking `token` before every operation.
     * @param inner Stream to take ownership of.
     * @param token Token shared with whoever may cancel.
     */
    cancellable(T inner, cancellation_token token)
        : inner_(std::forward<T>(inner)), token_(std::move(token)) {}

    /// @return The checked token; copy it to keep it beyond the wrapper.
    [[nodiscard]] const cancellation_token& token() const noexcept {
        return token_;
    }
    /// @return The wrapped stream, for operations not covered here.
    [[nodiscard]] const std::remove_reference_t<T>& get_ref() const noexcept {
        return inner_;
    }
    /// @return Mutable access to the wrapped stream. Not checked.
    [[nodiscard]] std::remove_reference_t<T>& get_mut() noexcept {
        return inner_;
    }
    /// @brief Give the wrapped stream back to the caller.
    [[nodiscard]] T into_inner() && {
        return std::forward<T>(inner_);
    }

    [[nodiscard]] result<std::size_t> read(std::span<std::byte> buffer)
        requires io::readable<T>
    {
        if (auto status = checkpoint("read"); !status.has_value()) {
            return err<std::size_t>(status.error());
        }
        return inner_.read(buffer);
    }

    [[nodiscard]] result<std::size_t>
    read_vectored(std::span<const std::span<std::byte>> buffers)
        requires io::readable<T>
    {
        if (auto status = checkpoint("read_vectored"); !status.has_value()) {
            return err<std::size_t>(status.error());
        }
        return io::read_vectored(inner_, buffers);
    }

    [[nodiscard]] result<std::size_t> read_to_end(std::vector<std::byte>& buffer)
        requires io::readable<T>
    {
        if (auto status = checkpoint("read_to_end"); !status.has_value()) {
            return err<std::size_t>(status.error());
        }
        return io::read_to_end(inner_, buffer);
    }

    [[nodiscard]] result<std::size_t> read_to_string(std::string& buffer)
        requires io::readable<T>
    {
        if (auto status = checkpoint("read_to_string"); !status.has_value()) {
            return err<std::size_t>(status.error());
        }
        return io::read_to_string(inner_, buffer);
    }

    [[nodiscard]] result<void> read_exact(std::span<std::byte> buffer)
        requires io::readable<T>
    {
        if (auto status = checkpoint("read_exact"); !status.has_value()) {
            return status;
        }
        return io::read_exact(inner_, buffer);
    }

    [[nodiscard]] result<std::size_t> write(std::span<const std::byte> buffer)
        requires io::writable<T>
    {
        if (auto status = checkpoint("write"); !status.has_value()) {
            return err<std::size_t>(status.error());
        }
        return inner_.write(buffer);
    }

    [[nodiscard]] result<void> flush()
        requires io::writable<T>
    {
        if (auto status = checkpoint("flush"); !status.has_value()) {
            return status;
        }
        return inner_.flush();
    }

    [[nodiscard]] result<std::size_t>
    write_vectored(std::span<const std::span<const std::byte>> buffers)
        requires io::writable<T>
    {
        if (auto status = checkpoint("write_vectored"); !status.has_value()) {
            return err<std::size_t>(status.error());
        }
        return io::write_vectored(inner_, buffers);
    }

    [[nodiscard]] result<void> write_all(std::span<const std::byte> buffer)
        requires io::writable<T>
    {
        if (auto status = checkpoint("write_all"); !status.has_value()) {
            return status;
        }
        return io::write_all(inner_, buffer);
    }

    template <class... Args>
        requires io::writable<T>
    [[nodiscard]] result<void> write_fmt(std::format_string<Args...> fmt,
                                         Args&&... args) {
        if (auto status = checkpoint("write_fmt"); !status.has_value()) {
            return status;
        }
        return io::write_fmt(inner_, fmt, std::forward<Args>(args)...);
    }

    [[nodiscard]] result<std::uint64_t> seek(io::seek_from target)
        requires io::seekable<T>
    {
        if (auto status = checkpoint("seek"); !status.has_value()) {
            return err<std::uint64_t>(status.error());
        }
        return inner_.seek(target);
    }

    [[nodiscard]] result<void> rewind()
        requires io::seekable<T>
    {
        if (auto status = checkpoint("rewind"); !status.has_value()) {
            return status;
        }
        return io::rewind(inner_);
    }

    [[nodiscard]] result<std::uint64_t> stream_position()
        requires io::seekable<T>
    {
        if (auto status = checkpoint("stream_position"); !status.has_value()) {
            return err<std::uint64_t>(status.error());
        }
        return io::stream_position(inner_);
    }

    [[nodiscard]] result<void> seek_relative(std::int64_t offset)
        requires io::seekable<T>
    {
        if (auto status = checkpoint("seek_relative"); !status.has_value()) {
            return status;
        }
        return io::seek_relative(inner_, offset);
    }

    /// @brief Checked: this is where a buffered source blocks for data.
    [[nodiscard]] result<std::span<const std::byte>> fill_buf()
        requires io::buffered_readable<T>
    {
        if (auto status = checkpoint("fill_buf"); !status.has_value()) {
            return err<std::span<const std::byte>>(status.error());
        }
        return inner_.fill_buf();
    }

    /// @brief Not checked: only advances over already buffered bytes.
    void consume(std::size_t amount)
        requires io::buffered_readable<T>
    {
        inner_.consume(amount);
    }

private:
    [[nodiscard]] result<void> checkpoint(std::string_view operation) const noexcept {
        auto status = token_.check();
        if (!status.has_value()) {
            detail::log_refused(operation, token_);
        }
        return status;
    }

    T inner_;
    cancellation_token token_;
};

} // namespace cancelio
