#pragma once

/**
 * @file
 * @brief Library logger backed by spdlog.
 */

#include <spdlog/spdlog.h>

namespace cancelio::log {

/**
 * @brief Named logger used by every cancelio component.
 *
 * Created on first use with a stderr colour sink at `warn` level.
 */
[[nodiscard]] spdlog::logger& logger();

/// @brief Change the library logger threshold.
void set_level(spdlog::level::level_enum level);

/**
 * @brief Apply levels from the `SPDLOG_LEVEL` environment variable.
 *
 * Accepts spdlog's syntax, e.g. `SPDLOG_LEVEL=cancelio=debug`.
 */
void init_from_env();

} // namespace cancelio::log
