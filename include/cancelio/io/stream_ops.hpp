#pragma once

/**
 * @file
 * @brief Composite stream operations built on the capability concepts.
 *
 * Each function calls the resource's own member of the same name when it
 * has one, and otherwise falls back to a generic loop over the required
 * primitive (`read`, `write`, `seek`).
 */

#include "cancelio/core/result.hpp"
#include "cancelio/io/concepts.hpp"
#include "cancelio/io/seek.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace cancelio::io {

namespace detail {

inline constexpr std::size_t default_chunk_size = 8U * 1024U;

[[nodiscard]] inline bool is_interrupted(const error& e) noexcept {
    return e.code() == std::errc::interrupted;
}

template <readable R, class Container>
[[nodiscard]] result<std::size_t> read_until_eof(R& source,
                                                 Container& buffer) {
    const std::size_t initial = buffer.size();
    while (true) {
        const std::size_t filled = buffer.size();
        buffer.resize(filled + default_chunk_size);
        auto count = source.read(
            std::as_writable_bytes(std::span{buffer}.subspan(filled)));
        if (!count.has_value()) {
            buffer.resize(filled);
            if (is_interrupted(count.error())) {
                continue;
            }
            return err<std::size_t>(count.error());
        }
        buffer.resize(filled + count.value());
        if (count.value() == 0) {
            return buffer.size() - initial;
        }
    }
}

} // namespace detail

/**
 * @brief Scatter read; the fallback fills the first non-empty buffer.
 */
template <readable R>
[[nodiscard]] result<std::size_t>
read_vectored(R& source, std::span<const std::span<std::byte>> buffers) {
    if constexpr (requires { source.read_vectored(buffers); }) {
        return source.read_vectored(buffers);
    } else {
        for (const auto buffer : buffers) {
            if (!buffer.empty()) {
                return source.read(buffer);
            }
        }
        return source.read(std::span<std::byte>{});
    }
}

/**
 * @brief Append everything until end of stream.
 * @return Number of bytes appended. Bytes read before a failure are kept.
 */
template <readable R>
[[nodiscard]] result<std::size_t> read_to_end(R& source,
                                              std::vector<std::byte>& buffer) {
    if constexpr (requires { source.read_to_end(buffer); }) {
        return source.read_to_end(buffer);
    } else {
        return detail::read_until_eof(source, buffer);
    }
}

/// @brief `read_to_end` into a string. Bytes are stored verbatim.
template <readable R>
[[nodiscard]] result<std::size_t> read_to_string(R& source,
                                                 std::string& buffer) {
    if constexpr (requires { source.read_to_string(buffer); }) {
        return source.read_to_string(buffer);
    } else {
        return detail::read_until_eof(source, buffer);
    }
}

/**
 * @brief Fill `buffer` completely.
 *
 * Fails with `errc::unexpected_eof` if the stream ends first.
 */
template <readable R>
[[nodiscard]] result<void> read_exact(R& source, std::span<std::byte> buffer) {
    if constexpr (requires { source.read_exact(buffer); }) {
        return source.read_exact(buffer);
    } else {
        while (!buffer.empty()) {
            auto count = source.read(buffer);
            if (!count.has_value()) {
                if (detail::is_interrupted(count.error())) {
                    continue;
                }
                return err<void>(count.error());
            }
            if (count.value() == 0) {
                return err<void>(errc::unexpected_eof);
            }
            buffer = buffer.subspan(count.value());
        }
        return ok();
    }
}

/// @brief Gather write; the fallback writes the first non-empty buffer.
template <writable W>
[[nodiscard]] result<std::size_t>
write_vectored(W& sink, std::span<const std::span<const std::byte>> buffers) {
    if constexpr (requires { sink.write_vectored(buffers); }) {
        return sink.write_vectored(buffers);
    } else {
        for (const auto buffer : buffers) {
            if (!buffer.empty()) {
                return sink.write(buffer);
            }
        }
        return sink.write(std::span<const std::byte>{});
    }
}

/**
 * @brief Write the whole buffer.
 *
 * Fails with `errc::write_zero` if the sink stops accepting bytes.
 */
template <writable W>
[[nodiscard]] result<void> write_all(W& sink,
                                     std::span<const std::byte> buffer) {
    if constexpr (requires { sink.write_all(buffer); }) {
        return sink.write_all(buffer);
    } else {
        while (!buffer.empty()) {
            auto count = sink.write(buffer);
            if (!count.has_value()) {
                if (detail::is_interrupted(count.error())) {
                    continue;
                }
                return err<void>(count.error());
            }
            if (count.value() == 0) {
                return err<void>(errc::write_zero);
            }
            buffer = buffer.subspan(count.value());
        }
        return ok();
    }
}

/// @brief Format with `std::format` and write the result in full.
template <writable W, class... Args>
[[nodiscard]] result<void> write_fmt(W& sink, std::format_string<Args...> fmt,
                                     Args&&... args) {
    if constexpr (requires { sink.write_fmt(fmt, std::forward<Args>(args)...); }) {
        return sink.write_fmt(fmt, std::forward<Args>(args)...);
    } else {
        const std::string text = std::format(fmt, std::forward<Args>(args)...);
        return io::write_all(sink, std::as_bytes(std::span{text}));
    }
}

/// @brief Seek back to position 0.
template <seekable S>
[[nodiscard]] result<void> rewind(S& stream) {
    if constexpr (requires { stream.rewind(); }) {
        return stream.rewind();
    } else {
        auto position = stream.seek(seek_from::start(0));
        if (!position.has_value()) {
            return err<void>(position.error());
        }
        return ok();
    }
}

/// @return Current absolute position.
template <seekable S>
[[nodiscard]] result<std::uint64_t> stream_position(S& stream) {
    if constexpr (requires { stream.stream_position(); }) {
        return stream.stream_position();
    } else {
        return stream.seek(seek_from::current(0));
    }
}

/// @brief Move the position by `offset` bytes.
template <seekable S>
[[nodiscard]] result<void> seek_relative(S& stream, std::int64_t offset) {
    if constexpr (requires { stream.seek_relative(offset); }) {
        return stream.seek_relative(offset);
    } else {
        auto position = stream.seek(seek_from::current(offset));
        if (!position.has_value()) {
            return err<void>(position.error());
        }
        return ok();
    }
}

/**
 * @brief Pump `source` into `sink` until end of stream.
 *
 * Every chunk goes through the resources' own `read`/`write`, so a
 * cancellable endpoint is checked once per chunk.
 * @return Total bytes copied.
 */
template <readable R, writable W>
[[nodiscard]] result<std::uint64_t> copy(R& source, W& sink) {
    std::array<std::byte, detail::default_chunk_size> chunk{};
    std::uint64_t total = 0;
    while (true) {
        auto count = source.read(chunk);
        if (!count.has_value()) {
            if (detail::is_interrupted(count.error())) {
                continue;
            }
            return err<std::uint64_t>(count.error());
        }
        if (count.value() == 0) {
            return total;
        }
        auto written = io::write_all(
            sink, std::span<const std::byte>{chunk.data(), count.value()});
        if (!written.has_value()) {
            return err<std::uint64_t>(written.error());
        }
        total += count.value();
    }
}

} // namespace cancelio::io
