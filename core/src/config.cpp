#include "orby/config.hpp"
#include "orby/cell.hpp"
#include "orby/platform.hpp"
#include <algorithm>
#include <format>
#include <limits>
#include <thread>
#include <vector>

namespace orby {

std::string_view to_string(AddressingMode mode) noexcept {
  return mode == AddressingMode::Ring ? "ring" : "bounded";
}

std::string_view to_string(DeletionPolicy policy) noexcept {
  return policy == DeletionPolicy::Compacting ? "compacting" : "tombstoning";
}

size_t EngineConfig::resolved_worker_threads() const noexcept {
  if (worker_threads_ != 0)
    return worker_threads_;
  return std::max<size_t>(1, std::thread::hardware_concurrency());
}

Result<EngineConfig> EngineConfigBuilder::build() const {
  if (cfg_.name_.empty())
    return make_error(ErrorKind::InvalidConfig, "name must not be empty");
  if (cfg_.capacity_ == 0)
    return make_error(ErrorKind::InvalidConfig, "capacity must be > 0");
  if (cfg_.dimension_ == 0)
    return make_error(ErrorKind::InvalidConfig, "dimension must be > 0");
  if (cfg_.addressing_ != AddressingMode::Ring &&
      cfg_.addressing_ != AddressingMode::Bounded)
    return make_error(ErrorKind::InvalidConfig, "unknown addressing mode");
  if (cfg_.deletion_ != DeletionPolicy::Tombstoning &&
      cfg_.deletion_ != DeletionPolicy::Compacting)
    return make_error(ErrorKind::InvalidConfig, "unknown deletion policy");
  if (cfg_.vault_dir_ && cfg_.vault_dir_->empty())
    return make_error(ErrorKind::InvalidConfig,
                      "vault directory must not be empty");
  if (cfg_.worker_threads_ > MAX_WORKER_THREADS)
    return make_error(ErrorKind::InvalidConfig,
                      std::format("worker_threads must be <= {}",
                                  MAX_WORKER_THREADS));

  // capacity * dimension * 16 must not overflow 64 bits
  const uint64_t max_u64 = std::numeric_limits<uint64_t>::max();
  if (static_cast<uint64_t>(cfg_.capacity_) >
      max_u64 / 16 / static_cast<uint64_t>(cfg_.dimension_))
    return make_error(ErrorKind::InvalidConfig,
                      "capacity * dimension overflows the address space");

  if (cfg_.capacity_ > std::vector<Cell>().max_size())
    return make_error(ErrorKind::InvalidConfig,
                      std::format("capacity {} exceeds the largest lane of {} "
                                  "cells",
                                  cfg_.capacity_,
                                  std::vector<Cell>().max_size()));

  // Without an explicit limit, the lanes must fit in memory the host can
  // hand out right now.
  uint64_t limit = 0;
  if (cfg_.memory_limit_bytes_) {
    limit = *cfg_.memory_limit_bytes_;
  } else {
    limit = platform::available_memory_bytes();
    if (limit == 0)
      limit = DEFAULT_MEMORY_LIMIT_BYTES;
  }
  if (cfg_.lane_bytes_total() > limit) {
    return make_error(ErrorKind::InsufficientMemory,
                      std::format("lanes need {} bytes, limit is {} bytes",
                                  cfg_.lane_bytes_total(), limit));
  }

  return cfg_;
}

} // namespace orby
