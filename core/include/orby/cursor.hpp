#pragma once

#include "orby/config.hpp"
#include <cstddef>
#include <optional>

namespace orby {

/**
 * @brief The single write/occupancy pointer shared by every lane.
 *
 * position() is the next index an insert writes to. length() is the number
 * of occupied indices; the occupied range is always [0, length()).
 *
 *   Bounded: position == length, both in [0, capacity].
 *   Ring:    position in [0, capacity). Before the first wrap
 *            position == length; afterwards length == capacity and
 *            position points at the oldest row.
 */
class Cursor {
public:
  Cursor(size_t capacity, AddressingMode mode) noexcept
      : capacity_(capacity), mode_(mode) {}

  size_t position() const noexcept { return position_; }
  size_t length() const noexcept { return length_; }
  size_t capacity() const noexcept { return capacity_; }
  AddressingMode mode() const noexcept { return mode_; }

  /// Bounded mode only: no slot left.
  bool full() const noexcept {
    return mode_ == AddressingMode::Bounded && position_ >= capacity_;
  }

  /// Slot the next insert writes to, or nullopt when bounded and full.
  std::optional<size_t> next_slot() const noexcept {
    if (full())
      return std::nullopt;
    return position_;
  }

  /// Called once every lane holds the new row at next_slot().
  void advance() noexcept;

  /// Compacting delete removed one occupied row.
  void shrink_after_compaction() noexcept;

  void reset() noexcept {
    position_ = 0;
    length_ = 0;
  }

  /**
   * @brief Restores a persisted cursor.
   * @return false (state unchanged) if the pair violates the mode invariant.
   */
  bool restore(size_t position, size_t length) noexcept;

private:
  size_t capacity_;
  AddressingMode mode_;
  size_t position_ = 0;
  size_t length_ = 0;
};

} // namespace orby
