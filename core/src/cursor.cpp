#include "orby/cursor.hpp"

namespace orby {

void Cursor::advance() noexcept {
  if (mode_ == AddressingMode::Ring) {
    position_ = (position_ + 1) % capacity_;
    if (length_ < capacity_)
      ++length_;
    return;
  }
  if (position_ < capacity_) {
    ++position_;
    length_ = position_;
  }
}

void Cursor::shrink_after_compaction() noexcept {
  if (length_ == 0)
    return;
  --length_;
  // The packed region ends at length_, so that is where the next row goes.
  position_ = length_;
}

bool Cursor::restore(size_t position, size_t length) noexcept {
  if (length > capacity_)
    return false;
  if (mode_ == AddressingMode::Bounded) {
    if (position != length)
      return false;
  } else {
    if (position >= capacity_)
      return false;
    if (length < capacity_ && position != length)
      return false;
  }
  position_ = position;
  length_ = length;
  return true;
}

} // namespace orby
