#include "orby/simd_impl.hpp"

// ---------------------------------------------------------------------------
// SIMDe: Portable SIMD. The x86 intrinsics below are translated at compile
// time to whatever the target offers (native AVX2, SSE2 emulation, NEON).
// See: https://github.com/simd-everywhere/simde
// ---------------------------------------------------------------------------
#define SIMDE_ENABLE_NATIVE_ALIASES
#include <simde/x86/avx2.h>
#include <simde/x86/sse2.h>

namespace orby::simd {

// ----------------------------------------------------------------------------
// 1. Scalar Implementation (baseline, no SIMD)
// ----------------------------------------------------------------------------
size_t match_eq_scalar(std::span<const Cell> cells, Cell target, size_t base,
                       std::vector<size_t> &out) {
  size_t found = 0;
  for (size_t i = 0; i < cells.size(); ++i) {
    if (cells[i] == target) {
      out.push_back(base + i);
      ++found;
    }
  }
  return found;
}

// ----------------------------------------------------------------------------
// 2. SSE2 Implementation
// ----------------------------------------------------------------------------
size_t match_eq_sse2(std::span<const Cell> cells, Cell target, size_t base,
                     std::vector<size_t> &out) {
  const __m128i needle =
      _mm_loadu_si128(reinterpret_cast<const __m128i *>(&target));
  const Cell *p = cells.data();
  size_t n = cells.size();
  size_t found = 0;

  for (size_t i = 0; i < n; ++i) {
    __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i *>(p + i));
    // All 16 byte lanes equal <=> the full 128-bit Cell is equal.
    if (_mm_movemask_epi8(_mm_cmpeq_epi8(v, needle)) == 0xFFFF) {
      out.push_back(base + i);
      ++found;
    }
  }
  return found;
}

// ----------------------------------------------------------------------------
// 3. AVX2 Implementation
// ----------------------------------------------------------------------------
namespace {

// Byte mask of one 256-bit compare -> bit 0: cell 0 matched, bit 1: cell 1.
inline unsigned pair_mask(__m256i v, __m256i needle) {
  const auto m = static_cast<uint32_t>(
      _mm256_movemask_epi8(_mm256_cmpeq_epi64(v, needle)));
  unsigned bits = 0;
  if ((m & 0x0000FFFFu) == 0x0000FFFFu)
    bits |= 1u;
  if ((m & 0xFFFF0000u) == 0xFFFF0000u)
    bits |= 2u;
  return bits;
}

} // namespace

size_t match_eq_avx2(std::span<const Cell> cells, Cell target, size_t base,
                     std::vector<size_t> &out) {
  const __m256i needle = _mm256_set_epi64x(
      static_cast<long long>(target.hi), static_cast<long long>(target.lo),
      static_cast<long long>(target.hi), static_cast<long long>(target.lo));
  const Cell *p = cells.data();
  size_t n = cells.size();
  size_t i = 0;
  size_t found = 0;

  // 4x Unrolling (8 cells per iteration)
  for (; i + 7 < n; i += 8) {
    __m256i v0 = _mm256_loadu_si256(reinterpret_cast<const __m256i *>(p + i));
    __m256i v1 =
        _mm256_loadu_si256(reinterpret_cast<const __m256i *>(p + i + 2));
    __m256i v2 =
        _mm256_loadu_si256(reinterpret_cast<const __m256i *>(p + i + 4));
    __m256i v3 =
        _mm256_loadu_si256(reinterpret_cast<const __m256i *>(p + i + 6));

    unsigned m = pair_mask(v0, needle) | (pair_mask(v1, needle) << 2) |
                 (pair_mask(v2, needle) << 4) | (pair_mask(v3, needle) << 6);
    if (m == 0) [[likely]]
      continue;
    for (unsigned b = 0; b < 8; ++b) {
      if (m & (1u << b)) {
        out.push_back(base + i + b);
        ++found;
      }
    }
  }

  // Remainder loop for pairs
  for (; i + 1 < n; i += 2) {
    __m256i v = _mm256_loadu_si256(reinterpret_cast<const __m256i *>(p + i));
    unsigned m = pair_mask(v, needle);
    if (m & 1u) {
      out.push_back(base + i);
      ++found;
    }
    if (m & 2u) {
      out.push_back(base + i + 1);
      ++found;
    }
  }

  // Scalar cleanup
  if (i < n && p[i] == target) {
    out.push_back(base + i);
    ++found;
  }
  return found;
}

// ----------------------------------------------------------------------------
// Runtime Dispatch
// ----------------------------------------------------------------------------
MatchEqFn get_best_match_eq_impl() {
#if defined(__AVX2__)
  return match_eq_avx2;
#else
  // Without native AVX2 the 256-bit path is emulated as two 128-bit halves,
  // which is no faster than the direct SSE2 kernel.
  return match_eq_sse2;
#endif
}

} // namespace orby::simd
