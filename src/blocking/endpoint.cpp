#include "cancelio/blocking/endpoint.hpp"

#include <format>

namespace cancelio::blocking {

endpoint endpoint::loopback(std::uint16_t port) {
    return endpoint{.host = "127.0.0.1", .port = port};
}

endpoint endpoint::any(std::uint16_t port) {
    return endpoint{.host = "0.0.0.0", .port = port};
}

std::string endpoint::to_string() const {
    return std::format("{}:{}", host, port);
}

} // namespace cancelio::blocking
