#include "orby/core.hpp"
#include "orby/simd_impl.hpp"
#include <format>

namespace orby::core {

std::string_view version() noexcept { return "0.3.0"; }

BuildInfo get_build_info() {
  BuildInfo info;

#if defined(__clang__)
  info.compiler = std::format("Clang {}", __clang_version__);
#elif defined(__GNUC__)
  info.compiler = std::format("GCC {}.{}.{}", __GNUC__, __GNUC_MINOR__,
                              __GNUC_PATCHLEVEL__);
#elif defined(_MSC_VER)
  info.compiler = std::format("MSVC {}", _MSC_VER);
#else
  info.compiler = "Unknown";
#endif

#if defined(__x86_64__) || defined(_M_X64)
  info.architecture = "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
  info.architecture = "arm64";
#else
  info.architecture = "Unknown";
#endif

  const auto kernel = simd::get_best_match_eq_impl();
  if (kernel == simd::match_eq_avx2)
    info.scan_kernel = "avx2";
  else if (kernel == simd::match_eq_sse2)
    info.scan_kernel = "sse2";
  else
    info.scan_kernel = "scalar";

  info.standard = std::format("C++{}", __cplusplus / 100 % 100);

  return info;
}

} // namespace orby::core
