#include "cancelio/io/memory.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>
#include <utility>

namespace cancelio::io {

result<std::size_t> empty_stream::read(std::span<std::byte> /*buffer*/) noexcept {
    return static_cast<std::size_t>(0);
}

result<std::size_t>
empty_stream::write(std::span<const std::byte> buffer) noexcept {
    return buffer.size();
}

result<void> empty_stream::flush() noexcept {
    return ok();
}

result<std::uint64_t> empty_stream::seek(seek_from /*target*/) noexcept {
    return static_cast<std::uint64_t>(0);
}

result<std::span<const std::byte>> empty_stream::fill_buf() noexcept {
    return std::span<const std::byte>{};
}

void empty_stream::consume(std::size_t /*amount*/) noexcept {}

cursor::cursor(std::vector<std::byte> data) noexcept : data_(std::move(data)) {}

result<std::size_t> cursor::read(std::span<std::byte> buffer) noexcept {
    const auto available = remaining();
    const std::size_t count = std::min(buffer.size(), available.size());
    if (count > 0) {
        std::memcpy(buffer.data(), available.data(), count);
    }
    position_ += count;
    return count;
}

result<std::size_t> cursor::write(std::span<const std::byte> buffer) {
    if (buffer.empty()) {
        return static_cast<std::size_t>(0);
    }
    if (position_ > std::numeric_limits<std::size_t>::max() - buffer.size()) {
        return err<std::size_t>(make_error_from_errno(EFBIG));
    }

    const auto start = static_cast<std::size_t>(position_);
    const std::size_t end = start + buffer.size();
    if (data_.size() < end) {
        data_.resize(end);
    }
    std::memcpy(data_.data() + start, buffer.data(), buffer.size());
    position_ = end;
    return buffer.size();
}

result<void> cursor::flush() noexcept {
    return ok();
}

result<std::uint64_t> cursor::seek(seek_from target) noexcept {
    std::int64_t base = 0;
    switch (target.whence) {
    case seek_from::origin::start:
        if (target.offset < 0) {
            return err<std::uint64_t>(make_error_from_errno(EINVAL));
        }
        position_ = static_cast<std::uint64_t>(target.offset);
        return position_;
    case seek_from::origin::current:
        base = static_cast<std::int64_t>(position_);
        break;
    case seek_from::origin::end:
        base = static_cast<std::int64_t>(data_.size());
        break;
    }

    std::int64_t next = 0;
    if (__builtin_add_overflow(base, target.offset, &next) || next < 0) {
        return err<std::uint64_t>(make_error_from_errno(EINVAL));
    }
    position_ = static_cast<std::uint64_t>(next);
    return position_;
}

result<std::span<const std::byte>> cursor::fill_buf() noexcept {
    return remaining();
}

void cursor::consume(std::size_t amount) noexcept {
    position_ += amount;
}

std::uint64_t cursor::position() const noexcept {
    return position_;
}

void cursor::set_position(std::uint64_t position) noexcept {
    position_ = position;
}

std::span<const std::byte> cursor::data() const noexcept {
    return data_;
}

std::vector<std::byte> cursor::into_inner() && noexcept {
    return std::move(data_);
}

std::span<const std::byte> cursor::remaining() const noexcept {
    if (position_ >= data_.size()) {
        return {};
    }
    return std::span<const std::byte>{data_}.subspan(
        static_cast<std::size_t>(position_));
}

} // namespace cancelio::io
