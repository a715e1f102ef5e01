#pragma once

/**
 * @file
 * @brief Seek origin and offset for positionable streams.
 */

#include <cstdint>

namespace cancelio::io {

/**
 * @brief Target of a `seek` call: an origin plus a signed offset.
 */
struct seek_from {
    /// Reference point for `offset`.
    enum class origin {
        start,
        current,
        end,
    };

    origin whence{origin::start};
    std::int64_t offset{};

    /// @brief Absolute position from the beginning of the stream.
    [[nodiscard]] static constexpr seek_from start(std::uint64_t position) noexcept {
        return seek_from{origin::start, static_cast<std::int64_t>(position)};
    }
    /// @brief Offset relative to the current position.
    [[nodiscard]] static constexpr seek_from current(std::int64_t delta) noexcept {
        return seek_from{origin::current, delta};
    }
    /// @brief Offset relative to the end of the stream.
    [[nodiscard]] static constexpr seek_from end(std::int64_t delta) noexcept {
        return seek_from{origin::end, delta};
    }

    friend constexpr bool operator==(const seek_from&, const seek_from&) = default;
};

} // namespace cancelio::io
