#include "orby/lane_store.hpp"
#include "orby/platform.hpp"
#include "orby/schema.hpp"
#include "orby/simd_impl.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <format>
#include <mutex>
#include <utility>

namespace orby {

LaneStore::LaneStore(size_t capacity, size_t dimension,
                     AddressingMode addressing, DeletionPolicy deletion)
    : cursor_(capacity, addressing), deletion_(deletion) {
  lanes_.reserve(dimension);
  for (size_t j = 0; j < dimension; ++j) {
    lanes_.emplace_back(capacity);
  }
}

// ===========================================================================
// Validation
// ===========================================================================

Result<void> LaneStore::check_row(const Row &row) const {
  if (row.size() != dimension()) {
    return make_error(ErrorKind::ShapeMismatch,
                      std::format("row has {} cells, store has {} lanes",
                                  row.size(), dimension()));
  }
  if (is_zero_row(row)) {
    return make_error(ErrorKind::ReservedRow,
                      "the all-zero row is reserved as the empty slot");
  }
  return {};
}

Result<void> LaneStore::check_lane(size_t lane) const {
  if (lane >= dimension()) {
    return make_error(
        ErrorKind::IndexOutOfRange,
        std::format("lane {} outside [0, {})", lane, dimension()));
  }
  return {};
}

bool LaneStore::is_live(size_t index) const noexcept {
  for (const auto &l : lanes_) {
    if (!l[index].is_zero())
      return true;
  }
  return false;
}

void LaneStore::write_row(size_t index, const Row &row) noexcept {
  for (size_t j = 0; j < lanes_.size(); ++j) {
    lanes_[j][index] = row[j];
  }
}

void LaneStore::zero_row(size_t index) noexcept {
  for (auto &l : lanes_) {
    l[index] = Cell{};
  }
}

// ===========================================================================
// Insert
// ===========================================================================

Result<size_t> LaneStore::insert_batch(std::span<const Row> rows) {
  // Reject the whole batch before touching any lane.
  for (const auto &row : rows) {
    if (auto ok = check_row(row); !ok)
      return std::unexpected(std::move(ok.error()));
  }

  size_t written = 0;
  for (const auto &row : rows) {
    auto slot = cursor_.next_slot();
    if (!slot) {
      return std::unexpected(Error{
          .kind = ErrorKind::CapacityExceeded,
          .detail = std::format("bounded store is full at {} rows", capacity()),
          .succeeded = written,
      });
    }
    // Overwriting a live row in ring mode keeps the live count unchanged.
    if (!is_live(*slot))
      ++live_;
    write_row(*slot, row);
    cursor_.advance();
    ++written;
  }
  return written;
}

// ===========================================================================
// Delete & Compaction
// ===========================================================================

Result<void> LaneStore::remove(ThreadPool &pool, size_t index) {
  if (index >= length()) {
    return make_error(
        ErrorKind::IndexOutOfRange,
        std::format("index {} outside occupied range [0, {})", index,
                    length()));
  }

  if (deletion_ == DeletionPolicy::Compacting) {
    compact(pool, index);
    return {};
  }

  // Tombstoning: deleting an empty slot is a no-op.
  if (is_live(index)) {
    zero_row(index);
    --live_;
  }
  return {};
}

void LaneStore::compact(ThreadPool &pool, size_t index) {
  const bool was_live = is_live(index);
  const size_t end = length();
  const size_t shifted = end - index - 1;

  if (lanes_.size() > 1 && shifted >= PARALLEL_SHIFT_MIN_ROWS) {
    parallel_for_each_index(pool, lanes_.size(), [&](size_t j) {
      lanes_[j].shift_left(index, end);
      return shifted;
    });
  } else {
    for (auto &l : lanes_) {
      l.shift_left(index, end);
    }
  }

  cursor_.shrink_after_compaction();
  if (was_live)
    --live_;
}

// ===========================================================================
// Id-based mutations
// ===========================================================================

Result<size_t> LaneStore::update_by_id(ThreadPool &pool, size_t lane, Cell id,
                                       const Row &row) {
  if (auto ok = check_lane(lane); !ok)
    return std::unexpected(std::move(ok.error()));
  if (id.is_zero())
    return make_error(ErrorKind::ReservedRow, "zero id cannot be matched");
  if (auto ok = check_row(row); !ok)
    return std::unexpected(std::move(ok.error()));

  const Cell targets[] = {id};
  auto hits = match_any(pool, lane, targets, 0);
  for (size_t i : hits) {
    write_row(i, row);
  }
  return hits.size();
}

Result<bool> LaneStore::upsert(ThreadPool &pool, size_t lane, Cell id,
                               const Row &row) {
  auto updated = update_by_id(pool, lane, id, row);
  if (!updated)
    return std::unexpected(std::move(updated.error()));
  if (*updated > 0)
    return false;

  auto inserted = insert_batch(std::span<const Row>(&row, 1));
  if (!inserted)
    return std::unexpected(std::move(inserted.error()));
  return true;
}

Result<size_t> LaneStore::purge_by_id(ThreadPool &pool, size_t lane, Cell id) {
  if (auto ok = check_lane(lane); !ok)
    return std::unexpected(std::move(ok.error()));
  if (id.is_zero())
    return make_error(ErrorKind::ReservedRow, "zero id cannot be matched");

  const Cell targets[] = {id};
  auto hits = match_any(pool, lane, targets, 0);
  // A non-zero id only ever matches live rows.
  for (size_t i : hits) {
    zero_row(i);
  }
  live_ -= hits.size();
  return hits.size();
}

Result<size_t> LaneStore::truncate(std::span<const Row> rows) {
  for (const auto &row : rows) {
    if (auto ok = check_row(row); !ok)
      return std::unexpected(std::move(ok.error()));
  }
  if (addressing() == AddressingMode::Bounded && rows.size() > capacity()) {
    return std::unexpected(Error{
        .kind = ErrorKind::CapacityExceeded,
        .detail = std::format("{} rows do not fit a bounded store of {}",
                              rows.size(), capacity()),
    });
  }

  for (auto &l : lanes_) {
    l.clear();
  }
  cursor_.reset();
  live_ = 0;
  return insert_batch(rows);
}

Result<void> LaneStore::restore_cursor(size_t position, size_t length) {
  if (!cursor_.restore(position, length)) {
    return make_error(
        ErrorKind::VaultCorrupt,
        std::format("cursor {} / length {} invalid for {} store of {}",
                    position, length, to_string(addressing()), capacity()));
  }
  live_ = count_active();
  return {};
}

// ===========================================================================
// Scan
// ===========================================================================

std::vector<size_t> LaneStore::scan(ThreadPool &pool,
                                    const ChunkScan &chunk_scan,
                                    size_t limit) const {
  const size_t n = length();
  std::vector<size_t> out;
  if (n == 0)
    return out;

  const size_t want = limit == 0 ? n : limit;
  static const size_t cache_bytes = platform::last_level_cache_bytes();
  const size_t chunk = scan_chunk_rows(dimension(), pool.size(), cache_bytes);
  const size_t chunks = (n + chunk - 1) / chunk;

  if (chunks == 1 || pool.size() == 1) {
    for (size_t c = 0; c < chunks && out.size() < want; ++c) {
      chunk_scan(c * chunk, std::min(n, (c + 1) * chunk), out);
    }
    if (out.size() > want)
      out.resize(want);
    return out;
  }

  // Workers claim chunks in ascending order. Chunk c is "settled" once c and
  // every chunk before it are done; when the settled prefix holds `want`
  // hits, chunks past it are abandoned.
  std::vector<std::vector<size_t>> found(chunks);
  std::vector<uint8_t> done(chunks, 0);
  std::atomic<size_t> next{0};
  std::atomic<size_t> cutoff{chunks};
  std::mutex settle_mutex;
  size_t settled = 0;
  size_t settled_hits = 0;

  auto worker = [&](size_t) {
    size_t scanned = 0;
    while (true) {
      size_t c = next.fetch_add(1, std::memory_order_relaxed);
      if (c >= cutoff.load(std::memory_order_acquire))
        return scanned;
      chunk_scan(c * chunk, std::min(n, (c + 1) * chunk), found[c]);
      ++scanned;

      std::lock_guard<std::mutex> lock(settle_mutex);
      done[c] = 1;
      while (settled < chunks && done[settled] && settled_hits < want) {
        settled_hits += found[settled].size();
        ++settled;
        if (settled_hits >= want)
          cutoff.store(settled, std::memory_order_release);
      }
    }
  };
  parallel_for_each_index(pool, std::min(pool.size(), chunks), worker);

  const size_t end = cutoff.load(std::memory_order_acquire);
  for (size_t c = 0; c < end && out.size() < want; ++c) {
    out.insert(out.end(), found[c].begin(), found[c].end());
  }
  if (out.size() > want)
    out.resize(want);
  return out;
}

std::vector<size_t> LaneStore::match_any(ThreadPool &pool, size_t lane,
                                         std::span<const Cell> targets,
                                         size_t limit) const {
  static const auto kernel = simd::get_best_match_eq_impl();

  std::vector<Cell> needles(targets.begin(), targets.end());
  std::sort(needles.begin(), needles.end());
  needles.erase(std::unique(needles.begin(), needles.end()), needles.end());
  if (needles.empty())
    return {};

  const auto cells = lanes_[lane].cells();
  auto chunk_scan = [&](size_t begin, size_t end, std::vector<size_t> &out) {
    const size_t first = out.size();
    const auto window = cells.subspan(begin, end - begin);
    for (const Cell &t : needles) {
      kernel(window, t, begin, out);
    }
    if (needles.size() > 1)
      std::sort(out.begin() + static_cast<std::ptrdiff_t>(first), out.end());
    // A zero needle also hits tombstones; keep live rows only.
    if (needles.front().is_zero()) {
      auto dead = std::remove_if(
          out.begin() + static_cast<std::ptrdiff_t>(first), out.end(),
          [this](size_t i) { return !is_live(i); });
      out.erase(dead, out.end());
    }
  };
  return scan(pool, chunk_scan, limit);
}

std::vector<RowRef>
LaneStore::materialize(const std::vector<size_t> &indices) const {
  std::vector<RowRef> rows;
  rows.reserve(indices.size());
  for (size_t i : indices) {
    RowRef ref{.index = i, .cells = Row(lanes_.size())};
    for (size_t j = 0; j < lanes_.size(); ++j) {
      ref.cells[j] = lanes_[j][i];
    }
    rows.push_back(std::move(ref));
  }
  return rows;
}

// ===========================================================================
// Reads
// ===========================================================================

Result<std::vector<size_t>>
LaneStore::find_indices(ThreadPool &pool, size_t lane,
                        const CellPredicate &pred, size_t limit) const {
  if (auto ok = check_lane(lane); !ok)
    return std::unexpected(std::move(ok.error()));

  const auto cells = lanes_[lane].cells();
  const size_t want = limit == 0 ? length() : limit;
  auto chunk_scan = [&](size_t begin, size_t end, std::vector<size_t> &out) {
    for (size_t i = begin; i < end && out.size() < want; ++i) {
      const Cell &c = cells[i];
      if (pred(c) && (!c.is_zero() || is_live(i)))
        out.push_back(i);
    }
  };
  return scan(pool, chunk_scan, limit);
}

Result<std::vector<RowRef>> LaneStore::query(ThreadPool &pool, size_t lane,
                                             const CellPredicate &pred,
                                             size_t limit) const {
  auto indices = find_indices(pool, lane, pred, limit);
  if (!indices)
    return std::unexpected(std::move(indices.error()));
  return materialize(*indices);
}

Result<std::vector<RowRef>> LaneStore::find_by(ThreadPool &pool, size_t lane,
                                               std::span<const Cell> targets,
                                               size_t limit) const {
  if (auto ok = check_lane(lane); !ok)
    return std::unexpected(std::move(ok.error()));
  return materialize(match_any(pool, lane, targets, limit));
}

Result<std::vector<RowRef>> LaneStore::find_range(ThreadPool &pool,
                                                  size_t lane, Cell min,
                                                  Cell max,
                                                  size_t limit) const {
  if (auto ok = check_lane(lane); !ok)
    return std::unexpected(std::move(ok.error()));
  if (min > max)
    return std::vector<RowRef>{};
  return query(
      pool, lane, [min, max](const Cell &c) { return min <= c && c <= max; },
      limit);
}

Result<Row> LaneStore::get(size_t index) const {
  if (index >= length()) {
    return make_error(
        ErrorKind::IndexOutOfRange,
        std::format("index {} outside occupied range [0, {})", index,
                    length()));
  }
  Row row(lanes_.size());
  for (size_t j = 0; j < lanes_.size(); ++j) {
    row[j] = lanes_[j][index];
  }
  return row;
}

size_t LaneStore::count_active() const noexcept {
  size_t live = 0;
  for (size_t i = 0; i < length(); ++i) {
    if (is_live(i))
      ++live;
  }
  return live;
}

} // namespace orby
