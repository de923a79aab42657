#pragma once

/**
 * @file cell.hpp
 * @brief The 128-bit fixed-width value stored in every lane.
 *
 * Layout is two little-endian 64-bit halves, low half first, so a Cell's
 * in-memory bytes on x86_64/ARM64 are identical to a little-endian u128.
 * Lane files are raw dumps of this layout.
 */

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace orby {

struct alignas(16) Cell {
  uint64_t lo = 0;
  uint64_t hi = 0;

  constexpr Cell() noexcept = default;
  constexpr Cell(uint64_t low) noexcept : lo(low) {}
  constexpr Cell(uint64_t high, uint64_t low) noexcept : lo(low), hi(high) {}

  /// True for the all-zero empty/tombstone sentinel.
  constexpr bool is_zero() const noexcept { return (lo | hi) == 0; }

  friend constexpr bool operator==(const Cell &a, const Cell &b) noexcept {
    return a.lo == b.lo && a.hi == b.hi;
  }

  friend constexpr std::strong_ordering operator<=>(const Cell &a,
                                                    const Cell &b) noexcept {
    if (auto c = a.hi <=> b.hi; c != 0)
      return c;
    return a.lo <=> b.lo;
  }

  /// 32 lowercase hex digits, most significant first.
  std::string to_hex() const;

  /// Canonical 8-4-4-4-12 UUID form.
  std::string to_uuid() const;

  /**
   * @brief Parses hex (1..32 digits, optional "0x") or UUID text.
   * Dashes are accepted only in canonical UUID positions.
   */
  static std::optional<Cell> parse(std::string_view text);
};

static_assert(sizeof(Cell) == 16, "Cell must be exactly 128 bits");
static_assert(std::is_trivially_copyable_v<Cell>);
static_assert(std::is_standard_layout_v<Cell>);

inline constexpr size_t CELL_BYTES = sizeof(Cell);

/// One value per lane, in lane order.
using Row = std::vector<Cell>;

/// A materialized row together with the index it was read from.
struct RowRef {
  size_t index = 0;
  Row cells;

  friend bool operator==(const RowRef &, const RowRef &) = default;
};

/// True when every cell of the row is zero (the reserved tombstone row).
inline bool is_zero_row(const Row &row) noexcept {
  for (const auto &c : row) {
    if (!c.is_zero())
      return false;
  }
  return true;
}

} // namespace orby

template <> struct std::hash<orby::Cell> {
  size_t operator()(const orby::Cell &c) const noexcept {
    // splitmix64 finalizer over the folded halves
    uint64_t x = c.lo ^ (c.hi * 0x9E3779B97F4A7C15ULL);
    x ^= x >> 30;
    x *= 0xBF58476D1CE4E5B9ULL;
    x ^= x >> 27;
    x *= 0x94D049BB133111EBULL;
    x ^= x >> 31;
    return static_cast<size_t>(x);
  }
};
