#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace orby {

enum class ErrorKind {
  ShapeMismatch,      ///< Row width != dimension count
  CapacityExceeded,   ///< Bounded mode is full
  IndexOutOfRange,    ///< Row or lane index outside the valid range
  ReservedRow,        ///< All-zero row (or zero id) used as data
  VaultWriteFailed,   ///< I/O failure while persisting a lane
  VaultCorrupt,       ///< Vault on disk is partial, wrong-sized or unreadable
  ConfigMismatch,     ///< Vault was written with a different shape
  InvalidConfig,      ///< Builder rejected a setting
  InsufficientMemory, ///< Lane allocation exceeds the configured limit
};

std::string_view to_string(ErrorKind kind) noexcept;

struct Error {
  ErrorKind kind;
  std::string detail;

  /// Lane that failed (vault errors only).
  size_t lane = 0;

  /// Rows committed before a CapacityExceeded stopped the batch.
  size_t succeeded = 0;

  /// Lanes whose write completed before sleep() failed.
  std::vector<size_t> completed_lanes;

  /// Underlying OS error for I/O failures.
  std::error_code cause;

  /// "<Kind>: <detail>[ (<cause>)]"
  std::string message() const;
};

template <typename T> using Result = std::expected<T, Error>;

inline std::unexpected<Error> make_error(ErrorKind kind, std::string detail) {
  return std::unexpected(Error{.kind = kind, .detail = std::move(detail)});
}

} // namespace orby
