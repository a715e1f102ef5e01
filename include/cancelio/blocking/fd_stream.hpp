#pragma once

/**
 * @file
 * @brief Blocking stream over an owned POSIX file descriptor.
 */

#include "cancelio/core/result.hpp"
#include "cancelio/io/seek.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <utility>

namespace cancelio::blocking {

/// @brief How `fd_stream::open` opens a path.
enum class open_mode {
    /// Existing file, read only.
    read_only,
    /// Create or truncate, write only.
    write_truncate,
    /// Create if missing, read and write, keep contents.
    read_write,
    /// Create if missing, every write goes to the end.
    append,
};

/**
 * @brief Move-only owner of a descriptor with blocking stream operations.
 *
 * Readable, writable and seekable (seeking fails with `ESPIPE` on pipes
 * and sockets). The descriptor is closed on destruction.
 */
class fd_stream {
public:
    /// Construct an empty stream (`native_handle() == -1`).
    fd_stream() noexcept = default;
    /// Take ownership of an existing descriptor.
    explicit fd_stream(int fd) noexcept;
    /// Close the descriptor if still owned.
    ~fd_stream() noexcept;

    fd_stream(const fd_stream&) = delete;
    fd_stream& operator=(const fd_stream&) = delete;

    /// Move ownership from another instance.
    fd_stream(fd_stream&& other) noexcept;
    /// Move-assign ownership, closing any descriptor held before.
    fd_stream& operator=(fd_stream&& other) noexcept;

    /**
     * @brief Open `path` with close-on-exec set.
     * @param path File to open.
     * @param mode Access and creation behaviour.
     */
    [[nodiscard]] static result<fd_stream>
    open(const std::filesystem::path& path, open_mode mode) noexcept;

    /**
     * @brief Create an anonymous pipe.
     * @return `{read_end, write_end}`.
     */
    [[nodiscard]] static result<std::pair<fd_stream, fd_stream>> pipe() noexcept;

    /**
     * @brief Read up to `buffer.size()` bytes.
     * @return Number of bytes read, 0 at end of file.
     */
    [[nodiscard]] result<std::size_t> read(std::span<std::byte> buffer) noexcept;
    /// @brief Scatter read with `readv`.
    [[nodiscard]] result<std::size_t>
    read_vectored(std::span<const std::span<std::byte>> buffers);
    /**
     * @brief Write up to `buffer.size()` bytes.
     * @return Number of bytes written.
     */
    [[nodiscard]] result<std::size_t>
    write(std::span<const std::byte> buffer) noexcept;
    /// @brief Gather write with `writev`.
    [[nodiscard]] result<std::size_t>
    write_vectored(std::span<const std::span<const std::byte>> buffers);
    /// @brief No user-space buffering, so nothing to flush.
    [[nodiscard]] result<void> flush() noexcept;
    /// @brief Push written data to the device (`fsync`).
    [[nodiscard]] result<void> sync() noexcept;
    /// @return New absolute offset.
    [[nodiscard]] result<std::uint64_t> seek(io::seek_from target) noexcept;

    /// @return Owned descriptor or `-1`.
    [[nodiscard]] int native_handle() const noexcept;
    /// @return `true` when the object owns a valid descriptor.
    [[nodiscard]] bool valid() const noexcept;
    /// @return Same as `valid()`.
    [[nodiscard]] explicit operator bool() const noexcept;

    /**
     * @brief Release ownership without closing.
     * @return Previously owned descriptor or `-1`.
     */
    [[nodiscard]] int release() noexcept;
    /**
     * @brief Replace the owned descriptor.
     * @param fd New descriptor. Defaults to `-1` (close and clear).
     */
    void reset(int fd = -1) noexcept;
    /// Swap ownership with another instance.
    void swap(fd_stream& other) noexcept;

private:
    int fd_{-1};
};

/**
 * @brief Close a descriptor and convert errno to `result<void>`.
 * @param fd File descriptor to close.
 */
[[nodiscard]] result<void> close_fd(int fd) noexcept;

} // namespace cancelio::blocking
