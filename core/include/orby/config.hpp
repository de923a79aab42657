#pragma once

#include "orby/error.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <spdlog/common.h>
#include <string>
#include <utility>

namespace orby {

/// How the shared cursor behaves when it reaches capacity.
enum class AddressingMode : uint8_t {
  Ring = 0,    ///< Wrap modulo capacity, overwriting the oldest row
  Bounded = 1, ///< Refuse inserts once full
};

/// What remove() does to the row it targets.
enum class DeletionPolicy : uint8_t {
  Tombstoning = 0, ///< Zero the slot in place; indices stay stable
  Compacting = 1,  ///< Shift the suffix left; indices after it change
};

std::string_view to_string(AddressingMode mode) noexcept;
std::string_view to_string(DeletionPolicy policy) noexcept;

/// Upper bound accepted for an explicit worker count.
constexpr size_t MAX_WORKER_THREADS = 256;

/// Memory budget assumed when no limit is set and the host reports none.
constexpr uint64_t DEFAULT_MEMORY_LIMIT_BYTES = 1ULL << 30;

/**
 * @brief Immutable engine configuration.
 *
 * Only EngineConfigBuilder::build() produces one, after validation.
 */
class EngineConfig {
public:
  const std::string &name() const noexcept { return name_; }
  size_t capacity() const noexcept { return capacity_; }
  size_t dimension() const noexcept { return dimension_; }
  AddressingMode addressing() const noexcept { return addressing_; }
  DeletionPolicy deletion() const noexcept { return deletion_; }

  /// Vault directory, or nullopt for memory-only engines.
  const std::optional<std::filesystem::path> &vault_dir() const noexcept {
    return vault_dir_;
  }

  bool autoload() const noexcept { return autoload_; }

  /// Configured worker count; 0 means hardware concurrency.
  size_t worker_threads() const noexcept { return worker_threads_; }

  /// Effective worker count after resolving 0.
  size_t resolved_worker_threads() const noexcept;

  std::optional<uint64_t> memory_limit_bytes() const noexcept {
    return memory_limit_bytes_;
  }

  spdlog::level::level_enum log_level() const noexcept { return log_level_; }

  /// capacity * dimension * 16
  uint64_t lane_bytes_total() const noexcept {
    return static_cast<uint64_t>(capacity_) * dimension_ * 16;
  }

private:
  friend class EngineConfigBuilder;
  EngineConfig() = default;

  std::string name_ = "orby";
  size_t capacity_ = 10'000;
  size_t dimension_ = 2;
  AddressingMode addressing_ = AddressingMode::Ring;
  DeletionPolicy deletion_ = DeletionPolicy::Tombstoning;
  std::optional<std::filesystem::path> vault_dir_;
  bool autoload_ = true;
  size_t worker_threads_ = 0;
  std::optional<uint64_t> memory_limit_bytes_;
  spdlog::level::level_enum log_level_ = spdlog::level::info;
};

/**
 * @brief Fluent builder for EngineConfig.
 *
 *   auto cfg = EngineConfigBuilder("sessions")
 *                  .capacity(1 << 20)
 *                  .dimension(3)
 *                  .addressing(AddressingMode::Bounded)
 *                  .vault("/var/lib/orby/sessions")
 *                  .build();
 */
class EngineConfigBuilder {
public:
  EngineConfigBuilder() = default;
  explicit EngineConfigBuilder(std::string name) { cfg_.name_ = std::move(name); }

  EngineConfigBuilder &name(std::string value) {
    cfg_.name_ = std::move(value);
    return *this;
  }
  EngineConfigBuilder &capacity(size_t rows) {
    cfg_.capacity_ = rows;
    return *this;
  }
  EngineConfigBuilder &dimension(size_t lanes) {
    cfg_.dimension_ = lanes;
    return *this;
  }
  EngineConfigBuilder &addressing(AddressingMode mode) {
    cfg_.addressing_ = mode;
    return *this;
  }
  EngineConfigBuilder &deletion(DeletionPolicy policy) {
    cfg_.deletion_ = policy;
    return *this;
  }
  /// Shorthand for deletion(Compacting) / deletion(Tombstoning).
  EngineConfigBuilder &compaction(bool enabled) {
    cfg_.deletion_ =
        enabled ? DeletionPolicy::Compacting : DeletionPolicy::Tombstoning;
    return *this;
  }
  EngineConfigBuilder &vault(std::filesystem::path dir) {
    cfg_.vault_dir_ = std::move(dir);
    return *this;
  }
  EngineConfigBuilder &memory_only() {
    cfg_.vault_dir_.reset();
    return *this;
  }
  EngineConfigBuilder &autoload(bool enabled) {
    cfg_.autoload_ = enabled;
    return *this;
  }
  EngineConfigBuilder &worker_threads(size_t n) {
    cfg_.worker_threads_ = n;
    return *this;
  }
  EngineConfigBuilder &memory_limit_bytes(uint64_t limit) {
    cfg_.memory_limit_bytes_ = limit;
    return *this;
  }
  EngineConfigBuilder &log_level(spdlog::level::level_enum level) {
    cfg_.log_level_ = level;
    return *this;
  }

  /// Validates every setting once and returns the frozen configuration.
  Result<EngineConfig> build() const;

private:
  EngineConfig cfg_;
};

} // namespace orby
