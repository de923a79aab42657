#pragma once

#include "orby/cell.hpp"
#include "orby/config.hpp"
#include "orby/cursor.hpp"
#include "orby/error.hpp"
#include "orby/lane.hpp"
#include "orby/thread_pool.hpp"
#include <cstddef>
#include <functional>
#include <span>
#include <vector>

namespace orby {

/// Match test applied to one lane's cell during a scan.
using CellPredicate = std::function<bool(const Cell &)>;

/**
 * @brief The engine's complete mutable state and every algorithm over it.
 *
 * LaneStore does no locking of its own: Orby wraps exactly one instance in
 * a Guarded<> and calls const members under the shared lock and non-const
 * members under the exclusive lock. Members that fan out take the pool by
 * reference and join every task before returning.
 *
 * Invariant: for every index i in [0, length()), the cells of all lanes at
 * i were written by the same insert, or are all zero (tombstone).
 */
class LaneStore {
public:
  LaneStore(size_t capacity, size_t dimension, AddressingMode addressing,
            DeletionPolicy deletion);

  size_t capacity() const noexcept { return cursor_.capacity(); }
  size_t dimension() const noexcept { return lanes_.size(); }
  size_t length() const noexcept { return cursor_.length(); }
  size_t position() const noexcept { return cursor_.position(); }
  size_t live_count() const noexcept { return live_; }
  AddressingMode addressing() const noexcept { return cursor_.mode(); }
  DeletionPolicy deletion() const noexcept { return deletion_; }

  const Lane &lane(size_t i) const noexcept { return lanes_[i]; }
  Lane &lane(size_t i) noexcept { return lanes_[i]; }

  // ═══════════════════════════════════════════════════════════════════════
  // Mutations (exclusive)
  // ═══════════════════════════════════════════════════════════════════════

  /**
   * @brief Appends rows at the shared cursor, in order.
   *
   * The whole batch is checked for shape and reserved rows before anything
   * is written. In bounded mode a full store stops the batch with
   * CapacityExceeded whose `succeeded` counts the rows already committed.
   * @return Number of rows written.
   */
  Result<size_t> insert_batch(std::span<const Row> rows);

  /// Deletes the row at `index` according to the deletion policy.
  Result<void> remove(ThreadPool &pool, size_t index);

  /// Overwrites every live row whose cell in `lane` equals `id`.
  Result<size_t> update_by_id(ThreadPool &pool, size_t lane, Cell id,
                              const Row &row);

  /// update_by_id(); inserts `row` when nothing matched. True if inserted.
  Result<bool> upsert(ThreadPool &pool, size_t lane, Cell id, const Row &row);

  /// Tombstones every live row whose cell in `lane` equals `id`.
  Result<size_t> purge_by_id(ThreadPool &pool, size_t lane, Cell id);

  /// Zeroes every lane, resets the cursor, then inserts `rows`.
  Result<size_t> truncate(std::span<const Row> rows);

  /**
   * @brief Installs a persisted cursor after the lanes were loaded and
   * recomputes the live count from lane contents.
   */
  Result<void> restore_cursor(size_t position, size_t length);

  // ═══════════════════════════════════════════════════════════════════════
  // Reads (shared)
  // ═══════════════════════════════════════════════════════════════════════

  /**
   * @brief Ascending indices in [0, length()) whose cell in `lane`
   * satisfies `pred`, at most `limit` of them (0 = unbounded).
   * Tombstoned rows never match.
   */
  Result<std::vector<size_t>> find_indices(ThreadPool &pool, size_t lane,
                                           const CellPredicate &pred,
                                           size_t limit) const;

  /// find_indices() materialized into full rows.
  Result<std::vector<RowRef>> query(ThreadPool &pool, size_t lane,
                                    const CellPredicate &pred,
                                    size_t limit) const;

  /// Rows whose cell in `lane` equals any of `targets` (SIMD equality scan).
  Result<std::vector<RowRef>> find_by(ThreadPool &pool, size_t lane,
                                      std::span<const Cell> targets,
                                      size_t limit) const;

  /// Rows with min <= cell <= max in `lane`.
  Result<std::vector<RowRef>> find_range(ThreadPool &pool, size_t lane,
                                         Cell min, Cell max,
                                         size_t limit) const;

  /// The row stored at `index` (all zero for a tombstone).
  Result<Row> get(size_t index) const;

  /// Live rows, recounted from lane contents.
  size_t count_active() const noexcept;

  /// True when any lane holds a non-zero cell at `index`.
  bool is_live(size_t index) const noexcept;

private:
  /// Chunk scanner: appends matching indices in [begin, end) to `out`.
  using ChunkScan =
      std::function<void(size_t begin, size_t end, std::vector<size_t> &out)>;

  Result<void> check_row(const Row &row) const;
  Result<void> check_lane(size_t lane) const;

  std::vector<size_t> scan(ThreadPool &pool, const ChunkScan &chunk_scan,
                           size_t limit) const;
  std::vector<size_t> match_any(ThreadPool &pool, size_t lane,
                                std::span<const Cell> targets,
                                size_t limit) const;
  std::vector<RowRef> materialize(const std::vector<size_t> &indices) const;

  void write_row(size_t index, const Row &row) noexcept;
  void zero_row(size_t index) noexcept;
  void compact(ThreadPool &pool, size_t index);

  std::vector<Lane> lanes_;
  Cursor cursor_;
  DeletionPolicy deletion_;
  size_t live_ = 0;
};

} // namespace orby
