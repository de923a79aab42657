#pragma once

/**
 * @file hash.hpp
 * @brief FNV-1a 64 used to checksum the vault manifest.
 */

#include <cstddef>
#include <cstdint>
#include <span>

namespace orby::hash {

inline constexpr uint64_t FNV1A_OFFSET_BASIS = 0xCBF29CE484222325ULL;
inline constexpr uint64_t FNV1A_PRIME = 0x00000100000001B3ULL;

/// Folds `bytes` into `digest`. Chain calls to cover split ranges.
constexpr uint64_t fnv1a_64(std::span<const std::byte> bytes,
                            uint64_t digest = FNV1A_OFFSET_BASIS) noexcept {
  for (std::byte b : bytes) {
    digest ^= std::to_integer<uint64_t>(b);
    digest *= FNV1A_PRIME;
  }
  return digest;
}

inline uint64_t fnv1a_64(const void *data, size_t size,
                         uint64_t digest = FNV1A_OFFSET_BASIS) noexcept {
  return fnv1a_64({static_cast<const std::byte *>(data), size}, digest);
}

} // namespace orby::hash
