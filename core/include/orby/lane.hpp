#pragma once

#include "orby/cell.hpp"
#include <cstddef>
#include <span>
#include <vector>

namespace orby {

/**
 * @brief One dimension's contiguous, fixed-capacity array of Cells.
 *
 * Zero-initialized on construction. Index checks are the caller's job:
 * LaneStore validates every index once per operation, so the hot accessors
 * here are unchecked.
 */
class Lane {
public:
  Lane() = default;
  explicit Lane(size_t capacity) : cells_(capacity) {}

  size_t capacity() const noexcept { return cells_.size(); }

  const Cell &operator[](size_t i) const noexcept { return cells_[i]; }
  Cell &operator[](size_t i) noexcept { return cells_[i]; }

  std::span<const Cell> cells() const noexcept { return cells_; }
  std::span<Cell> cells() noexcept { return cells_; }

  /// Raw little-endian view, capacity * 16 bytes. Used by the Vault.
  std::span<const std::byte> bytes() const noexcept {
    return std::as_bytes(std::span<const Cell>(cells_));
  }
  std::span<std::byte> writable_bytes() noexcept {
    return std::as_writable_bytes(std::span<Cell>(cells_));
  }

  /**
   * @brief Moves [from + 1, end) to [from, end - 1) and zeroes end - 1.
   * With from == end - 1 only that slot is zeroed.
   */
  void shift_left(size_t from, size_t end) noexcept;

  /// Zeroes [begin, end).
  void zero_range(size_t begin, size_t end) noexcept;

  void clear() noexcept { zero_range(0, cells_.size()); }

private:
  std::vector<Cell> cells_;
};

} // namespace orby
