#include "orby/error.hpp"
#include <format>

namespace orby {

std::string_view to_string(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::ShapeMismatch:
    return "ShapeMismatch";
  case ErrorKind::CapacityExceeded:
    return "CapacityExceeded";
  case ErrorKind::IndexOutOfRange:
    return "IndexOutOfRange";
  case ErrorKind::ReservedRow:
    return "ReservedRow";
  case ErrorKind::VaultWriteFailed:
    return "VaultWriteFailed";
  case ErrorKind::VaultCorrupt:
    return "VaultCorrupt";
  case ErrorKind::ConfigMismatch:
    return "ConfigMismatch";
  case ErrorKind::InvalidConfig:
    return "InvalidConfig";
  case ErrorKind::InsufficientMemory:
    return "InsufficientMemory";
  }
  return "Unknown";
}

std::string Error::message() const {
  std::string out = std::format("{}: {}", to_string(kind), detail);
  if (kind == ErrorKind::VaultWriteFailed) {
    out += std::format(" [lane {}, {} lane(s) completed]", lane,
                       completed_lanes.size());
  }
  if (kind == ErrorKind::CapacityExceeded && succeeded > 0) {
    out += std::format(" [{} row(s) committed]", succeeded);
  }
  if (cause) {
    out += std::format(" ({})", cause.message());
  }
  return out;
}

} // namespace orby
