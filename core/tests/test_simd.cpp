#include "orby/core.hpp"
#include "orby/simd_impl.hpp"
#include <gtest/gtest.h>
#include <random>
#include <vector>

using namespace orby;

namespace {

std::vector<size_t> run(simd::MatchEqFn fn, const std::vector<Cell> &cells,
                        Cell target, size_t base) {
  std::vector<size_t> out;
  size_t n = fn(cells, target, base, out);
  EXPECT_EQ(n, out.size());
  return out;
}

} // namespace

TEST(Simd, KernelsAgreeWithScalar) {
  std::mt19937_64 rng(7);
  const Cell needles[] = {Cell(3, 9), Cell(0, 9), Cell(3, 0), Cell{}};

  // Sizes around the unroll width and its remainders.
  for (size_t n : {0u, 1u, 2u, 3u, 7u, 8u, 9u, 15u, 16u, 17u, 1000u}) {
    std::vector<Cell> cells(n);
    for (auto &c : cells) {
      // Small alphabet so every needle, and near misses, show up.
      c = Cell(rng() % 4, (rng() % 2) * 9);
    }
    for (const Cell &t : needles) {
      auto expected = run(simd::match_eq_scalar, cells, t, 100);
      EXPECT_EQ(run(simd::match_eq_sse2, cells, t, 100), expected)
          << "sse2 n=" << n;
      EXPECT_EQ(run(simd::match_eq_avx2, cells, t, 100), expected)
          << "avx2 n=" << n;
      EXPECT_EQ(run(simd::get_best_match_eq_impl(), cells, t, 100), expected)
          << "dispatch n=" << n;
    }
  }
}

TEST(Simd, HalfMatchIsNotAMatch) {
  std::vector<Cell> cells = {Cell(1, 2), Cell(2, 1), Cell(1, 1), Cell(2, 2)};
  const std::vector<simd::MatchEqFn> kernels = {
      simd::match_eq_scalar, simd::match_eq_sse2, simd::match_eq_avx2};
  for (auto fn : kernels) {
    EXPECT_EQ(run(fn, cells, Cell(1, 2), 0), std::vector<size_t>{0});
    EXPECT_TRUE(run(fn, cells, Cell(9, 9), 0).empty());
  }
}

TEST(Simd, AppendsAfterExistingOutput) {
  std::vector<Cell> cells = {Cell(5), Cell(6), Cell(5)};
  std::vector<size_t> out = {42};
  simd::get_best_match_eq_impl()(cells, Cell(5), 10, out);
  EXPECT_EQ(out, (std::vector<size_t>{42, 10, 12}));
}

TEST(Simd, BuildInfoNamesTheDispatchedKernel) {
  const auto info = core::get_build_info();
  const auto kernel = simd::get_best_match_eq_impl();
  ASSERT_NE(kernel, nullptr);
  EXPECT_EQ(info.scan_kernel, kernel == simd::match_eq_avx2 ? "avx2" : "sse2");
  EXPECT_FALSE(info.compiler.empty());
  EXPECT_EQ(core::version(), "0.3.0");
}
