// Header for SIMD implementation
#pragma once
#include "orby/cell.hpp"
#include <cstddef>
#include <span>
#include <vector>

namespace orby::simd {

/**
 * Equality scan kernel: appends (base + i) to `out` for every i where
 * cells[i] == target, in ascending order. Returns the number appended.
 */
using MatchEqFn = size_t (*)(std::span<const Cell> cells, Cell target,
                             size_t base, std::vector<size_t> &out);

// --- Implementations ---

// 1. Scalar (Portable)
size_t match_eq_scalar(std::span<const Cell> cells, Cell target, size_t base,
                       std::vector<size_t> &out);

// 2. SSE2: one Cell per 128-bit register
size_t match_eq_sse2(std::span<const Cell> cells, Cell target, size_t base,
                     std::vector<size_t> &out);

// 3. AVX2: two Cells per 256-bit register, 4x unrolled
size_t match_eq_avx2(std::span<const Cell> cells, Cell target, size_t base,
                     std::vector<size_t> &out);

// --- Dispatch ---
// All vector paths go through SIMDe, so they compile and run on any target;
// on ARM64 SIMDe lowers them to NEON.
MatchEqFn get_best_match_eq_impl();

} // namespace orby::simd
