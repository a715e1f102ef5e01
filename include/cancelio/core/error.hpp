#pragma once

/**
 * @file
 * @brief Lightweight error wrapper for library-wide error propagation.
 */

#include <cerrno>
#include <string>
#include <system_error>

namespace cancelio {

/**
 * @brief Library-specific error codes, reported in the `cancelio` category.
 */
enum class errc {
    /// Operation refused because its cancellation token was cancelled.
    cancelled = 1,
    /// Stream ended before the requested number of bytes was read.
    unexpected_eof,
    /// Sink accepted zero bytes while data remained to be written.
    write_zero,
};

/// @return The `cancelio` error category singleton.
[[nodiscard]] const std::error_category& cancelio_category() noexcept;

/// @brief Convert an `errc` into a `std::error_code`.
[[nodiscard]] std::error_code make_error_code(errc value) noexcept;

/**
 * @brief Error value used across `result<T>`.
 *
 * This type wraps `std::error_code` while providing helper constructors
 * for errno-based failures and for cancellation.
 */
class error {
public:
    /// Construct a success-like empty error (`value() == 0`).
    error() noexcept = default;
    /// Construct from an explicit error code.
    explicit error(std::error_code code) noexcept;
    /// Construct from a library error code.
    explicit error(errc value) noexcept;

    /**
     * @brief Build an error from errno.
     * @param value errno value. Defaults to current `errno`.
     * @return Converted `error` in the system category.
     */
    [[nodiscard]] static error from_errno(int value = errno) noexcept;

    /**
     * @brief The error reported by a cancelled token.
     *
     * Compares equal to `std::errc::broken_pipe` so generic I/O handling
     * treats it as a broken pipe.
     */
    [[nodiscard]] static error cancelled() noexcept;

    /// @return `true` when this error was produced by a cancelled token.
    [[nodiscard]] bool is_cancelled() const noexcept;

    /// @return Underlying `std::error_code`.
    [[nodiscard]] std::error_code code() const noexcept;
    /// @return Integer code value.
    [[nodiscard]] int value() const noexcept;
    /// @return Human-readable message for the code.
    [[nodiscard]] std::string message() const;

private:
    std::error_code code_;
};

/**
 * @brief Convenience helper that wraps an errno value into `error`.
 * @param value errno value to convert.
 */
[[nodiscard]] error make_error_from_errno(int value) noexcept;

} // namespace cancelio

template <>
struct std::is_error_code_enum<cancelio::errc> : std::true_type {};
