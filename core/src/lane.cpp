#include "orby/lane.hpp"
#include <algorithm>

namespace orby {

void Lane::shift_left(size_t from, size_t end) noexcept {
  end = std::min(end, cells_.size());
  if (from + 1 >= end) {
    if (from < end)
      cells_[from] = Cell{};
    return;
  }
  // Overlapping move towards lower addresses: std::copy is well-defined here.
  std::copy(cells_.begin() + static_cast<std::ptrdiff_t>(from + 1),
            cells_.begin() + static_cast<std::ptrdiff_t>(end),
            cells_.begin() + static_cast<std::ptrdiff_t>(from));
  cells_[end - 1] = Cell{};
}

void Lane::zero_range(size_t begin, size_t end) noexcept {
  end = std::min(end, cells_.size());
  if (begin >= end)
    return;
  std::fill(cells_.begin() + static_cast<std::ptrdiff_t>(begin),
            cells_.begin() + static_cast<std::ptrdiff_t>(end), Cell{});
}

} // namespace orby
