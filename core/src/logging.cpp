#include "orby/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace orby::log {

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get(LOGGER_NAME))
      return existing;
    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
  }();
  return instance;
}

void set_level(spdlog::level::level_enum level) { logger()->set_level(level); }

} // namespace orby::log
