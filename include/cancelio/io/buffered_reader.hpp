#pragma once

/**
 * @file
 * @brief Read buffering over any readable stream.
 */

#include "cancelio/core/result.hpp"
#include "cancelio/io/concepts.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include <utility>
#include <vector>

namespace cancelio::io {

/**
 * @brief Adds an internal buffer to a readable stream.
 *
 * Models `buffered_readable`. Reads at least as large as the buffer skip
 * it when it is empty.
 * @tparam R Wrapped readable stream, held by value.
 */
template <readable R>
class buffered_reader {
public:
    /// Default buffer capacity in bytes.
    static constexpr std::size_t default_capacity = 8U * 1024U;

    /**
     * @brief Wrap `inner` with a buffer of `capacity` bytes.
     * @param inner Stream to read from.
     * @param capacity Buffer size; 0 is bumped to 1.
     */
    explicit buffered_reader(R inner, std::size_t capacity = default_capacity)
        : inner_(std::move(inner)), buffer_(std::max<std::size_t>(capacity, 1U)) {}

    [[nodiscard]] result<std::size_t> read(std::span<std::byte> out) {
        if (begin_ == end_ && out.size() >= buffer_.size()) {
            return inner_.read(out);
        }

        auto available = fill_buf();
        if (!available.has_value()) {
            return err<std::size_t>(available.error());
        }
        const std::size_t count = std::min(out.size(), available.value().size());
        if (count > 0) {
            std::memcpy(out.data(), available.value().data(), count);
        }
        consume(count);
        return count;
    }

    /**
     * @brief Return buffered bytes, reading from the inner stream if none.
     * @return Empty span at end of stream.
     */
    [[nodiscard]] result<std::span<const std::byte>> fill_buf() {
        if (begin_ == end_) {
            auto count = inner_.read(std::span<std::byte>{buffer_});
            if (!count.has_value()) {
                return err<std::span<const std::byte>>(count.error());
            }
            begin_ = 0;
            end_ = count.value();
        }
        return buffer();
    }

    /// @brief Mark `amount` buffered bytes as used.
    void consume(std::size_t amount) noexcept {
        begin_ = std::min(begin_ + amount, end_);
    }

    /// @return Bytes buffered and not yet consumed.
    [[nodiscard]] std::span<const std::byte> buffer() const noexcept {
        return std::span<const std::byte>{buffer_}.subspan(begin_, end_ - begin_);
    }
    /// @return Buffer size in bytes.
    [[nodiscard]] std::size_t capacity() const noexcept {
        return buffer_.size();
    }

    [[nodiscard]] const R& get_ref() const noexcept {
        return inner_;
    }
    [[nodiscard]] R& get_mut() noexcept {
        return inner_;
    }
    /// @brief Return the inner stream. Buffered bytes are discarded.
    [[nodiscard]] R into_inner() && {
        return std::move(inner_);
    }

private:
    R inner_;
    std::vector<std::byte> buffer_;
    std::size_t begin_{0};
    std::size_t end_{0};
};

} // namespace cancelio::io
