#include "orby/orby.hpp"
#include "orby/logging.hpp"
#include <algorithm>
#include <format>
#include <new>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace orby {

Orby::Orby(EngineConfig config)
    : config_(std::move(config)),
      pool_(std::min(config_.resolved_worker_threads(), MAX_WORKER_THREADS)),
      state_(std::in_place, config_.capacity(), config_.dimension(),
             config_.addressing(), config_.deletion()) {
  if (config_.vault_dir())
    vault_.emplace(*config_.vault_dir());
}

Orby::~Orby() { pool_.stop(); }

Result<std::unique_ptr<Orby>> Orby::create(EngineConfig config) {
  log::set_level(config.log_level());
  auto logger = log::logger();

  const uint64_t lane_bytes = config.lane_bytes_total();
  std::unique_ptr<Orby> engine;
  try {
    engine.reset(new Orby(std::move(config)));
  } catch (const std::bad_alloc &) {
    logger->error("cannot allocate {} bytes of lanes", lane_bytes);
    return make_error(
        ErrorKind::InsufficientMemory,
        std::format("cannot allocate {} bytes of lanes", lane_bytes));
  } catch (const std::length_error &e) {
    logger->error("lanes of {} bytes exceed the address space: {}", lane_bytes,
                  e.what());
    return make_error(ErrorKind::InvalidConfig,
                      std::format("lanes of {} bytes cannot be allocated: {}",
                                  lane_bytes, e.what()));
  } catch (const std::system_error &e) {
    logger->error("cannot start worker threads: {}", e.what());
    Error err{.kind = ErrorKind::InsufficientMemory,
              .detail = std::format("cannot start worker threads: {}",
                                    e.what())};
    err.cause = e.code();
    return std::unexpected(std::move(err));
  }

  const auto &cfg = engine->config_;
  if (engine->vault_ && cfg.autoload()) {
    auto loaded = engine->state_.write([&](LaneStore &s) {
      return engine->vault_->load(s, engine->pool_);
    });
    if (!loaded)
      return std::unexpected(std::move(loaded.error()));
  }

  logger->debug("engine '{}' created: {} rows x {} lanes, {}, {}, {} workers",
                cfg.name(), cfg.capacity(), cfg.dimension(),
                to_string(cfg.addressing()), to_string(cfg.deletion()),
                engine->pool_.size());
  return engine;
}

// ===========================================================================
// Core operations
// ===========================================================================

Result<size_t> Orby::insert_batch(std::span<const Row> rows) {
  auto result =
      state_.write([&](LaneStore &s) { return s.insert_batch(rows); });
  if (!result && result.error().kind == ErrorKind::CapacityExceeded &&
      result.error().succeeded > 0) {
    log::logger()->warn("engine '{}': batch stopped after {} of {} rows: {}",
                        config_.name(), result.error().succeeded, rows.size(),
                        result.error().detail);
  }
  return result;
}

Result<std::vector<RowRef>> Orby::query(size_t lane, const CellPredicate &pred,
                                        size_t limit) const {
  return state_.read([&](const LaneStore &s) {
    return s.query(pool_, lane, pred, limit);
  });
}

Result<void> Orby::remove(size_t index) {
  return state_.write([&](LaneStore &s) -> Result<void> {
    auto ok = s.remove(pool_, index);
    if (ok && s.deletion() == DeletionPolicy::Compacting) {
      log::logger()->debug("engine '{}': compacted index {}, length now {}",
                           config_.name(), index, s.length());
    }
    return ok;
  });
}

Result<void> Orby::sleep() {
  if (!vault_)
    return make_error(ErrorKind::InvalidConfig, "no vault configured");
  return state_.write(
      [&](LaneStore &s) { return vault_->sleep(s, pool_); });
}

// ===========================================================================
// Lookups
// ===========================================================================

Result<Row> Orby::get(size_t index) const {
  return state_.read([&](const LaneStore &s) { return s.get(index); });
}

Result<std::vector<size_t>> Orby::find_indices(size_t lane,
                                               const CellPredicate &pred,
                                               size_t limit) const {
  return state_.read([&](const LaneStore &s) {
    return s.find_indices(pool_, lane, pred, limit);
  });
}

Result<std::vector<RowRef>> Orby::find_by(size_t lane,
                                          std::span<const Cell> targets,
                                          size_t limit) const {
  return state_.read([&](const LaneStore &s) {
    return s.find_by(pool_, lane, targets, limit);
  });
}

Result<std::vector<RowRef>> Orby::find_range(size_t lane, Cell min, Cell max,
                                             size_t limit) const {
  return state_.read([&](const LaneStore &s) {
    return s.find_range(pool_, lane, min, max, limit);
  });
}

// ===========================================================================
// Id-based mutations
// ===========================================================================

Result<size_t> Orby::update_by_id(size_t lane, Cell id, const Row &row) {
  return state_.write(
      [&](LaneStore &s) { return s.update_by_id(pool_, lane, id, row); });
}

Result<bool> Orby::upsert(size_t lane, Cell id, const Row &row) {
  return state_.write(
      [&](LaneStore &s) { return s.upsert(pool_, lane, id, row); });
}

Result<size_t> Orby::purge_by_id(size_t lane, Cell id) {
  return state_.write(
      [&](LaneStore &s) { return s.purge_by_id(pool_, lane, id); });
}

Result<size_t> Orby::truncate(std::span<const Row> rows) {
  auto result = state_.write([&](LaneStore &s) { return s.truncate(rows); });
  if (result) {
    log::logger()->debug("engine '{}': truncated, reloaded {} rows",
                         config_.name(), *result);
  }
  return result;
}

// ===========================================================================
// Introspection
// ===========================================================================

size_t Orby::len() const {
  return state_.read([](const LaneStore &s) { return s.length(); });
}

size_t Orby::live_count() const {
  return state_.read([](const LaneStore &s) { return s.live_count(); });
}

size_t Orby::cursor() const {
  return state_.read([](const LaneStore &s) { return s.position(); });
}

size_t Orby::count_active() const {
  return state_.read([](const LaneStore &s) { return s.count_active(); });
}

EngineMeta Orby::meta() const {
  return state_.read([&](const LaneStore &s) {
    return EngineMeta{
        .name = config_.name(),
        .capacity = s.capacity(),
        .dimension = s.dimension(),
        .addressing = s.addressing(),
        .deletion = s.deletion(),
        .length = s.length(),
        .cursor = s.position(),
        .live_count = s.live_count(),
        .vault_dir = config_.vault_dir(),
    };
  });
}

} // namespace orby
