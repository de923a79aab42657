#pragma once

#include "orby/cell.hpp"
#include "orby/config.hpp"
#include "orby/error.hpp"
#include "orby/guarded.hpp"
#include "orby/lane_store.hpp"
#include "orby/thread_pool.hpp"
#include "orby/vault.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace orby {

/// Point-in-time snapshot of an engine's shape and occupancy.
struct EngineMeta {
  std::string name;
  size_t capacity = 0;
  size_t dimension = 0;
  AddressingMode addressing = AddressingMode::Ring;
  DeletionPolicy deletion = DeletionPolicy::Tombstoning;
  size_t length = 0;
  size_t cursor = 0;
  size_t live_count = 0;
  std::optional<std::filesystem::path> vault_dir;
};

/**
 * @brief Columnar index engine over fixed-width 128-bit cells.
 *
 * Thread-safe. The whole state sits behind one reader/writer guard:
 * mutations and sleep() run exclusively, lookups run concurrently with each
 * other. Work inside a single call fans out on the engine's own worker pool
 * and is joined before the call returns.
 *
 * Rows are addressed by their index in [0, len()). With the compacting
 * deletion policy, indices after a removed row shift down by one.
 */
class Orby {
public:
  /**
   * @brief Allocates the lanes and, when a vault is configured with
   * autoload, loads it.
   */
  static Result<std::unique_ptr<Orby>> create(EngineConfig config);

  ~Orby();

  Orby(const Orby &) = delete;
  Orby &operator=(const Orby &) = delete;

  const EngineConfig &config() const noexcept { return config_; }

  // ── Core operations ─────────────────────────────────────────────────────

  Result<size_t> insert_batch(std::span<const Row> rows);
  Result<size_t> insert(const Row &row) {
    return insert_batch(std::span<const Row>(&row, 1));
  }

  /// Up to `limit` rows (0 = all) whose cell in `lane` satisfies `pred`,
  /// ascending by index.
  Result<std::vector<RowRef>> query(size_t lane, const CellPredicate &pred,
                                    size_t limit = 0) const;

  Result<void> remove(size_t index);

  /// Persists all lanes to the configured vault.
  Result<void> sleep();

  // ── Lookups ─────────────────────────────────────────────────────────────

  Result<Row> get(size_t index) const;
  Result<std::vector<size_t>> find_indices(size_t lane,
                                           const CellPredicate &pred,
                                           size_t limit = 0) const;
  Result<std::vector<RowRef>> find_by(size_t lane,
                                      std::span<const Cell> targets,
                                      size_t limit = 0) const;
  Result<std::vector<RowRef>> find_range(size_t lane, Cell min, Cell max,
                                         size_t limit = 0) const;

  // ── Id-based mutations ──────────────────────────────────────────────────

  Result<size_t> update_by_id(size_t lane, Cell id, const Row &row);
  Result<bool> upsert(size_t lane, Cell id, const Row &row);
  Result<size_t> purge_by_id(size_t lane, Cell id);
  Result<size_t> truncate(std::span<const Row> rows);

  // ── Introspection ───────────────────────────────────────────────────────

  size_t len() const;
  size_t live_count() const;
  size_t cursor() const;
  size_t capacity() const noexcept { return config_.capacity(); }
  size_t dimension() const noexcept { return config_.dimension(); }
  EngineMeta meta() const;
  size_t count_active() const;

private:
  explicit Orby(EngineConfig config);

  EngineConfig config_;
  mutable ThreadPool pool_;
  Guarded<LaneStore> state_;
  std::optional<Vault> vault_;
};

} // namespace orby
