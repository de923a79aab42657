#pragma once

#include <string>
#include <string_view>

// Symbol visibility macros
#if defined(_WIN32)
#if defined(ORBY_CORE_EXPORTS)
#define ORBY_CORE_EXPORT __declspec(dllexport)
#else
#define ORBY_CORE_EXPORT __declspec(dllimport)
#endif
#else
#define ORBY_CORE_EXPORT __attribute__((visibility("default")))
#endif

namespace orby::core {

struct BuildInfo {
  std::string compiler;
  std::string architecture;
  std::string scan_kernel; ///< Equality-scan kernel the dispatcher selects
  std::string standard;
};

/**
 * @brief Returns the library version ("major.minor.patch").
 */
ORBY_CORE_EXPORT std::string_view version() noexcept;

/**
 * @brief Returns build-time information about the library.
 */
ORBY_CORE_EXPORT BuildInfo get_build_info();

} // namespace orby::core
