#pragma once

/**
 * @file
 * @brief IPv4 host/port pair used by the blocking TCP streams.
 */

#include <cstdint>
#include <string>

namespace cancelio::blocking {

/**
 * @brief IPv4 endpoint represented as textual host and TCP port.
 */
struct endpoint {
    /// IPv4 literal.
    std::string host;
    /// Network port in host byte order.
    std::uint16_t port{};

    /**
     * @brief Create a loopback endpoint (`127.0.0.1:port`).
     * @param port Destination/listen port.
     */
    [[nodiscard]] static endpoint loopback(std::uint16_t port);
    /**
     * @brief Create an any-address endpoint (`0.0.0.0:port`).
     * @param port Listen port.
     */
    [[nodiscard]] static endpoint any(std::uint16_t port);

    /// @return `host:port`, for diagnostics.
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const endpoint&, const endpoint&) = default;
};

} // namespace cancelio::blocking
