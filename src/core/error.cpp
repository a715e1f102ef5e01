#include "cancelio/core/error.hpp"

namespace cancelio {

namespace {

class cancelio_category_impl final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "cancelio";
    }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
        case errc::cancelled:
            return "operation cancelled (broken pipe)";
        case errc::unexpected_eof:
            return "unexpected end of stream";
        case errc::write_zero:
            return "failed to write whole buffer";
        }
        return "unknown cancelio error";
    }

    [[nodiscard]] std::error_condition
    default_error_condition(int value) const noexcept override {
        if (static_cast<errc>(value) == errc::cancelled) {
            return std::errc::broken_pipe;
        }
        return std::error_condition{value, *this};
    }
};

} // namespace

const std::error_category& cancelio_category() noexcept {
    static const cancelio_category_impl instance;
    return instance;
}

std::error_code make_error_code(errc value) noexcept {
    return std::error_code{static_cast<int>(value), cancelio_category()};
}

error::error(std::error_code code) noexcept : code_(code) {}

error::error(errc value) noexcept : code_(make_error_code(value)) {}

error error::from_errno(int value) noexcept {
    return error{std::error_code{value, std::system_category()}};
}

error error::cancelled() noexcept {
    return error{errc::cancelled};
}

bool error::is_cancelled() const noexcept {
    return code_ == make_error_code(errc::cancelled);
}

std::error_code error::code() const noexcept {
    return code_;
}

int error::value() const noexcept {
    return code_.value();
}

std::string error::message() const {
    return code_.message();
}

error make_error_from_errno(int value) noexcept {
    return error::from_errno(value);
}

} // namespace cancelio
