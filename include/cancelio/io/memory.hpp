#pragma once

/**
 * @file
 * @brief In-memory streams: an always-ready empty stream and a byte cursor.
 */

#include "cancelio/core/result.hpp"
#include "cancelio/io/seek.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace cancelio::io {

/**
 * @brief Source that is always at end of stream and sink that discards.
 *
 * Never blocks and never fails; useful as the inner stream of tight
 * cancellation loops.
 */
class empty_stream {
public:
    /// @return Always 0.
    [[nodiscard]] result<std::size_t> read(std::span<std::byte> buffer) noexcept;
    /// @return `buffer.size()`; the bytes are dropped.
    [[nodiscard]] result<std::size_t>
    write(std::span<const std::byte> buffer) noexcept;
    [[nodiscard]] result<void> flush() noexcept;
    /// @return Always 0.
    [[nodiscard]] result<std::uint64_t> seek(seek_from target) noexcept;
    /// @return An empty span.
    [[nodiscard]] result<std::span<const std::byte>> fill_buf() noexcept;
    void consume(std::size_t amount) noexcept;
};

/**
 * @brief Growable byte buffer with a read/write position.
 *
 * Reads return bytes from the position onwards. Writes overwrite from the
 * position and extend the buffer, zero-filling any gap left by a seek past
 * the end.
 */
class cursor {
public:
    /// Construct an empty cursor at position 0.
    cursor() noexcept = default;
    /// Construct over existing bytes, positioned at 0.
    explicit cursor(std::vector<std::byte> data) noexcept;

    [[nodiscard]] result<std::size_t> read(std::span<std::byte> buffer) noexcept;
    [[nodiscard]] result<std::size_t> write(std::span<const std::byte> buffer);
    [[nodiscard]] result<void> flush() noexcept;
    /**
     * @brief Move the position.
     *
     * Fails with `EINVAL` when the target is negative or overflows.
     */
    [[nodiscard]] result<std::uint64_t> seek(seek_from target) noexcept;
    /// @return Bytes from the position to the end, without advancing.
    [[nodiscard]] result<std::span<const std::byte>> fill_buf() noexcept;
    /// @brief Advance the position by `amount`.
    void consume(std::size_t amount) noexcept;

    /// @return Current position.
    [[nodiscard]] std::uint64_t position() const noexcept;
    /// @brief Set the position directly.
    void set_position(std::uint64_t position) noexcept;
    /// @return All stored bytes.
    [[nodiscard]] std::span<const std::byte> data() const noexcept;
    /// @brief Release the underlying bytes.
    [[nodiscard]] std::vector<std::byte> into_inner() && noexcept;

private:
    [[nodiscard]] std::span<const std::byte> remaining() const noexcept;

    std::vector<std::byte> data_;
    std::uint64_t position_{0};
};

} // namespace cancelio::io
