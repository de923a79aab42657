#include "orby/cell.hpp"
#include <format>

namespace orby {

namespace {

int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool is_uuid_dash_position(size_t i) noexcept {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

std::string Cell::to_hex() const { return std::format("{:016x}{:016x}", hi, lo); }

std::string Cell::to_uuid() const {
  std::string h = to_hex();
  return std::format("{}-{}-{}-{}-{}", h.substr(0, 8), h.substr(8, 4),
                     h.substr(12, 4), h.substr(16, 4), h.substr(20, 12));
}

std::optional<Cell> Cell::parse(std::string_view text) {
  if (text.starts_with("0x") || text.starts_with("0X"))
    text.remove_prefix(2);

  const bool uuid_form = text.size() == 36;
  if (text.empty() || (text.size() > 32 && !uuid_form))
    return std::nullopt;

  Cell out;
  size_t digits = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (uuid_form && is_uuid_dash_position(i)) {
      if (c != '-')
        return std::nullopt;
      continue;
    }
    int v = hex_value(c);
    if (v < 0)
      return std::nullopt;
    // Shift the 128-bit accumulator left by one nibble.
    out.hi = (out.hi << 4) | (out.lo >> 60);
    out.lo = (out.lo << 4) | static_cast<uint64_t>(v);
    ++digits;
  }
  if (uuid_form && digits != 32)
    return std::nullopt;
  return out;
}

} // namespace orby
