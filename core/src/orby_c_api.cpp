/**
 * @file orby_c_api.cpp
 * @brief C API implementation. Exception-safe FFI boundary.
 *
 * C++ exceptions crossing an FFI boundary are undefined behavior, so every
 * extern "C" function that can reach the engine is wrapped in:
 *     try { ... } catch (const std::exception& e) { log; return ORBY_ERR_...; }
 *                  catch (...) { return ORBY_ERR_UNKNOWN; }
 */

#include "orby/orby_c_api.h"
#include "orby/core.hpp"
#include "orby/logging.hpp"
#include "orby/orby.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <filesystem>
#include <new>
#include <string>
#include <utility>
#include <vector>

static_assert(sizeof(orby_cell_t) == sizeof(orby::Cell));

// ===========================================================================
// Internal helpers
// ===========================================================================

static orby::Orby *to_engine(orby_engine_t *handle) {
  return reinterpret_cast<orby::Orby *>(handle);
}

static orby::Cell to_cell(orby_cell_t c) { return orby::Cell(c.hi, c.lo); }

static orby_cell_t from_cell(const orby::Cell &c) { return {c.lo, c.hi}; }

static orby_error_t to_code(const orby::Error &err) {
  using orby::ErrorKind;
  switch (err.kind) {
  case ErrorKind::ShapeMismatch:
    return ORBY_ERR_SHAPE_MISMATCH;
  case ErrorKind::CapacityExceeded:
    return ORBY_ERR_CAPACITY_EXCEEDED;
  case ErrorKind::IndexOutOfRange:
    return ORBY_ERR_INDEX_OUT_OF_RANGE;
  case ErrorKind::ReservedRow:
    return ORBY_ERR_RESERVED_ROW;
  case ErrorKind::VaultWriteFailed:
    return ORBY_ERR_VAULT_WRITE_FAILED;
  case ErrorKind::VaultCorrupt:
    return ORBY_ERR_VAULT_CORRUPT;
  case ErrorKind::ConfigMismatch:
    return ORBY_ERR_CONFIG_MISMATCH;
  case ErrorKind::InvalidConfig:
    return ORBY_ERR_INVALID_CONFIG;
  case ErrorKind::InsufficientMemory:
    return ORBY_ERR_OUT_OF_MEMORY;
  }
  return ORBY_ERR_UNKNOWN;
}

static orby_error_t internal_failure(const char *fn, const std::exception &e) {
  orby::log::logger()->error("{}: {}", fn, e.what());
  return ORBY_ERR_UNKNOWN;
}

extern "C" {

// ===========================================================================
// Version
// ===========================================================================

ORBY_API const char *orby_version(void) {
  static const std::string v(orby::core::version());
  return v.c_str();
}

// ===========================================================================
// Lifecycle
// ===========================================================================

ORBY_API orby_error_t orby_create(const orby_options_t *opts,
                                  orby_engine_t **out_engine) {
  if (!opts || !out_engine)
    return ORBY_ERR_NULL_PTR;

  try {
    orby::EngineConfigBuilder builder;
    builder.capacity(opts->capacity)
        .dimension(opts->dimension)
        .addressing(static_cast<orby::AddressingMode>(opts->addressing))
        .deletion(static_cast<orby::DeletionPolicy>(opts->deletion))
        .autoload(opts->autoload != 0)
        .worker_threads(opts->worker_threads);
    if (opts->vault_path)
      builder.vault(std::filesystem::path(opts->vault_path));

    auto cfg = builder.build();
    if (!cfg)
      return to_code(cfg.error());
    auto engine = orby::Orby::create(std::move(*cfg));
    if (!engine)
      return to_code(engine.error());

    *out_engine = reinterpret_cast<orby_engine_t *>(engine->release());
    return ORBY_OK;
  } catch (const std::bad_alloc &) {
    return ORBY_ERR_OUT_OF_MEMORY;
  } catch (const std::exception &e) {
    return internal_failure("orby_create", e);
  } catch (...) {
    return ORBY_ERR_UNKNOWN;
  }
}

ORBY_API orby_error_t orby_destroy(orby_engine_t *engine) {
  if (!engine)
    return ORBY_OK;

  try {
    delete to_engine(engine);
    return ORBY_OK;
  } catch (...) {
    return ORBY_ERR_UNKNOWN;
  }
}

// ===========================================================================
// Mutations
// ===========================================================================

ORBY_API orby_error_t orby_insert_batch(orby_engine_t *engine,
                                        const orby_cell_t *cells,
                                        size_t row_count,
                                        size_t *out_inserted) {
  if (!engine || (!cells && row_count > 0))
    return ORBY_ERR_NULL_PTR;
  if (out_inserted)
    *out_inserted = 0;

  try {
    auto *e = to_engine(engine);
    const size_t dim = e->dimension();
    std::vector<orby::Row> rows(row_count, orby::Row(dim));
    for (size_t r = 0; r < row_count; ++r) {
      for (size_t j = 0; j < dim; ++j) {
        rows[r][j] = to_cell(cells[r * dim + j]);
      }
    }

    auto result = e->insert_batch(rows);
    if (!result) {
      if (out_inserted)
        *out_inserted = result.error().succeeded;
      return to_code(result.error());
    }
    if (out_inserted)
      *out_inserted = *result;
    return ORBY_OK;
  } catch (const std::bad_alloc &) {
    return ORBY_ERR_OUT_OF_MEMORY;
  } catch (const std::exception &e) {
    return internal_failure("orby_insert_batch", e);
  } catch (...) {
    return ORBY_ERR_UNKNOWN;
  }
}

ORBY_API orby_error_t orby_remove(orby_engine_t *engine, size_t index) {
  if (!engine)
    return ORBY_ERR_NULL_PTR;

  try {
    auto result = to_engine(engine)->remove(index);
    return result ? ORBY_OK : to_code(result.error());
  } catch (const std::exception &e) {
    return internal_failure("orby_remove", e);
  } catch (...) {
    return ORBY_ERR_UNKNOWN;
  }
}

ORBY_API orby_error_t orby_sleep(orby_engine_t *engine) {
  if (!engine)
    return ORBY_ERR_NULL_PTR;

  try {
    auto result = to_engine(engine)->sleep();
    return result ? ORBY_OK : to_code(result.error());
  } catch (const std::exception &e) {
    return internal_failure("orby_sleep", e);
  } catch (...) {
    return ORBY_ERR_UNKNOWN;
  }
}

// ===========================================================================
// Reads
// ===========================================================================

ORBY_API orby_error_t orby_get_row(orby_engine_t *engine, size_t index,
                                   orby_cell_t *out_cells, size_t max_cells) {
  if (!engine || !out_cells)
    return ORBY_ERR_NULL_PTR;

  try {
    auto *e = to_engine(engine);
    if (max_cells < e->dimension())
      return ORBY_ERR_BUFFER_TOO_SMALL;
    auto row = e->get(index);
    if (!row)
      return to_code(row.error());
    std::transform(row->begin(), row->end(), out_cells, from_cell);
    return ORBY_OK;
  } catch (const std::exception &e) {
    return internal_failure("orby_get_row", e);
  } catch (...) {
    return ORBY_ERR_UNKNOWN;
  }
}

ORBY_API orby_error_t orby_find_by(orby_engine_t *engine, size_t lane,
                                   orby_cell_t target, size_t limit,
                                   size_t *out_indices, orby_cell_t *out_cells,
                                   size_t max_rows, size_t *out_actual_count) {
  if (!engine || !out_indices || !out_actual_count)
    return ORBY_ERR_NULL_PTR;
  *out_actual_count = 0;

  try {
    auto *e = to_engine(engine);
    // Ask for one row more than fits so an overflow can be reported.
    const size_t probe = max_rows + 1;
    const size_t effective = limit == 0 ? probe : std::min(limit, probe);
    const orby::Cell targets[] = {to_cell(target)};

    auto rows = e->find_by(lane, targets, effective);
    if (!rows)
      return to_code(rows.error());

    const size_t n = std::min(rows->size(), max_rows);
    const size_t dim = e->dimension();
    for (size_t r = 0; r < n; ++r) {
      const auto &ref = (*rows)[r];
      out_indices[r] = ref.index;
      if (out_cells) {
        std::transform(ref.cells.begin(), ref.cells.end(),
                       out_cells + r * dim, from_cell);
      }
    }
    *out_actual_count = n;
    return rows->size() > max_rows ? ORBY_ERR_BUFFER_TOO_SMALL : ORBY_OK;
  } catch (const std::exception &e) {
    return internal_failure("orby_find_by", e);
  } catch (...) {
    return ORBY_ERR_UNKNOWN;
  }
}

ORBY_API orby_error_t orby_len(orby_engine_t *engine, size_t *out_len) {
  if (!engine || !out_len)
    return ORBY_ERR_NULL_PTR;
  try {
    *out_len = to_engine(engine)->len();
    return ORBY_OK;
  } catch (...) {
    return ORBY_ERR_UNKNOWN;
  }
}

ORBY_API orby_error_t orby_live_count(orby_engine_t *engine,
                                      size_t *out_count) {
  if (!engine || !out_count)
    return ORBY_ERR_NULL_PTR;
  try {
    *out_count = to_engine(engine)->live_count();
    return ORBY_OK;
  } catch (...) {
    return ORBY_ERR_UNKNOWN;
  }
}

} // extern "C"
