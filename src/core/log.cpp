#include "cancelio/core/log.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace cancelio::log {

namespace {

constexpr const char* logger_name = "cancelio";

std::shared_ptr<spdlog::logger> make_logger() {
    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(logger_name);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%-5l%$] [t%t] %v");
    created->set_level(spdlog::level::warn);
    return created;
}

} // namespace

spdlog::logger& logger() {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

void set_level(spdlog::level::level_enum level) {
    logger().set_level(level);
}

void init_from_env() {
    // Registers the logger first so the env levels reach it.
    (void)logger();
    spdlog::cfg::load_env_levels();
}

} // namespace cancelio::log
