#pragma once

/**
 * @file
 * @brief Capability sets describing blocking stream resources.
 *
 * A resource models only the capabilities it actually has; a write-only
 * sink need not provide `seek` or `read`.
 */

#include "cancelio/core/result.hpp"
#include "cancelio/io/seek.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

namespace cancelio::io {

/// Byte source: `read` returns the count transferred, 0 at end of stream.
template <class T>
concept readable = requires(T& source, std::span<std::byte> buffer) {
    { source.read(buffer) } -> std::same_as<result<std::size_t>>;
};

/// Byte sink with an explicit `flush`.
template <class T>
concept writable = requires(T& sink, std::span<const std::byte> buffer) {
    { sink.write(buffer) } -> std::same_as<result<std::size_t>>;
    { sink.flush() } -> std::same_as<result<void>>;
};

/// Positionable stream; `seek` returns the new absolute position.
template <class T>
concept seekable = requires(T& stream, seek_from target) {
    { stream.seek(target) } -> std::same_as<result<std::uint64_t>>;
};

/**
 * @brief Readable source exposing its internal buffer.
 *
 * `fill_buf` may block to refill; `consume` only advances over bytes
 * already returned by `fill_buf` and never fails.
 */
template <class T>
concept buffered_readable =
    readable<T> && requires(T& source, std::size_t amount) {
        { source.fill_buf() } -> std::same_as<result<std::span<const std::byte>>>;
        { source.consume(amount) } -> std::same_as<void>;
    };

} // namespace cancelio::io
