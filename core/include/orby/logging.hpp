#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace orby::log {

/// Name of the shared logger in the spdlog registry.
inline constexpr const char *LOGGER_NAME = "orby";

/**
 * @brief Returns the process-wide "orby" logger (stderr, colored).
 *
 * Created on first use. If the application already registered a logger
 * under the same name, that one is returned instead so hosts can route
 * engine output into their own sinks.
 */
std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

} // namespace orby::log
