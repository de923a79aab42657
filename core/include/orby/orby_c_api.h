/**
 * @file orby_c_api.h
 * @brief Flat C API for the Orby lane engine.
 *
 * DESIGN INVARIANTS:
 *   1. All functions are `extern "C"` for flat ABI compatibility.
 *   2. All functions return `orby_error_t` (integer enum) for FFI safety.
 *   3. C++ exceptions NEVER cross the FFI boundary.
 *   4. Caller-allocated buffers: the caller passes pre-allocated arrays +
 *      their capacity + an out count. Nothing is allocated for the caller.
 *   5. Opaque pointer pattern: `orby_engine_t` hides all C++ internals.
 *   6. ORBY_API macro handles DLL export on Windows and visibility on POSIX.
 *
 * Rows cross the boundary flattened row-major: row r, lane j lives at
 * cells[r * dimension + j].
 */

#ifndef ORBY_C_API_H
#define ORBY_C_API_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32) || defined(_WIN64)
#ifdef ORBY_BUILDING_SHARED
#define ORBY_API __declspec(dllexport)
#else
#define ORBY_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define ORBY_API __attribute__((visibility("default")))
#else
#define ORBY_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* ═══════════════════════════════════════════════════════════════════════════
 * ERROR CODES (orby_error_t)
 * ═══════════════════════════════════════════════════════════════════════════
 */
typedef enum {
  ORBY_OK = 0,                        /**< Success */
  ORBY_ERR_NULL_PTR = -1,             /**< A required pointer was NULL */
  ORBY_ERR_SHAPE_MISMATCH = -2,       /**< Row width != dimension */
  ORBY_ERR_CAPACITY_EXCEEDED = -3,    /**< Bounded engine is full */
  ORBY_ERR_INDEX_OUT_OF_RANGE = -4,   /**< Row or lane index out of range */
  ORBY_ERR_RESERVED_ROW = -5,         /**< All-zero row or zero id */
  ORBY_ERR_VAULT_WRITE_FAILED = -6,   /**< sleep() could not persist a lane */
  ORBY_ERR_VAULT_CORRUPT = -7,        /**< Vault on disk is unusable */
  ORBY_ERR_CONFIG_MISMATCH = -8,      /**< Vault shape != engine shape */
  ORBY_ERR_INVALID_CONFIG = -9,       /**< Options rejected */
  ORBY_ERR_OUT_OF_MEMORY = -10,       /**< Lane allocation failed */
  ORBY_ERR_BUFFER_TOO_SMALL = -11,    /**< Caller buffer too small */
  ORBY_ERR_UNKNOWN = -99              /**< Unexpected internal error */
} orby_error_t;

/** Opaque engine handle. */
typedef struct orby_engine_s orby_engine_t;

/** One 128-bit cell, low half first (same layout as orby::Cell). */
typedef struct {
  uint64_t lo;
  uint64_t hi;
} orby_cell_t;

/** Addressing modes (orby::AddressingMode). */
enum { ORBY_ADDRESSING_RING = 0, ORBY_ADDRESSING_BOUNDED = 1 };

/** Deletion policies (orby::DeletionPolicy). */
enum { ORBY_DELETION_TOMBSTONING = 0, ORBY_DELETION_COMPACTING = 1 };

/**
 * @brief Engine options. Zero-initialize, then set what you need; a zero
 * capacity or dimension is rejected.
 */
typedef struct {
  size_t capacity;
  uint32_t dimension;
  uint8_t addressing;     /**< ORBY_ADDRESSING_* */
  uint8_t deletion;       /**< ORBY_DELETION_* */
  uint8_t autoload;       /**< Load an existing vault on create (non-zero) */
  uint8_t reserved;
  uint32_t worker_threads; /**< 0 = hardware concurrency */
  const char *vault_path; /**< NULL for a memory-only engine */
} orby_options_t;

/**
 * @brief Returns the Orby version string.
 * @return Null-terminated static string (never freed by caller).
 */
ORBY_API const char *orby_version(void);

/**
 * @brief Creates an engine, loading its vault when configured.
 * @note Caller MUST call orby_destroy() when done.
 */
ORBY_API orby_error_t orby_create(const orby_options_t *opts,
                                  orby_engine_t **out_engine);

/** @brief Destroys an engine. NULL is a no-op. */
ORBY_API orby_error_t orby_destroy(orby_engine_t *engine);

/**
 * @brief Inserts `row_count` rows of `dimension` cells each.
 * @param[out] out_inserted  Rows committed (also set on CAPACITY_EXCEEDED).
 *                           May be NULL.
 */
ORBY_API orby_error_t orby_insert_batch(orby_engine_t *engine,
                                        const orby_cell_t *cells,
                                        size_t row_count,
                                        size_t *out_inserted);

/** @brief Deletes the row at `index` per the engine's deletion policy. */
ORBY_API orby_error_t orby_remove(orby_engine_t *engine, size_t index);

/**
 * @brief Copies the row at `index` into `out_cells` (`max_cells` >= dimension).
 */
ORBY_API orby_error_t orby_get_row(orby_engine_t *engine, size_t index,
                                   orby_cell_t *out_cells, size_t max_cells);

/**
 * @brief Rows whose cell in `lane` equals `target`, ascending by index.
 *
 * @param limit             0 = no limit (still bounded by max_rows).
 * @param[out] out_indices  Caller array of max_rows entries.
 * @param[out] out_cells    NULL, or caller array of max_rows * dimension.
 * @param[out] out_actual_count  Rows written.
 * @return ORBY_ERR_BUFFER_TOO_SMALL if more rows matched than max_rows; the
 *         first max_rows are still written.
 */
ORBY_API orby_error_t orby_find_by(orby_engine_t *engine, size_t lane,
                                   orby_cell_t target, size_t limit,
                                   size_t *out_indices, orby_cell_t *out_cells,
                                   size_t max_rows, size_t *out_actual_count);

/** @brief Occupied length. */
ORBY_API orby_error_t orby_len(orby_engine_t *engine, size_t *out_len);

/** @brief Live (non-tombstoned) rows. */
ORBY_API orby_error_t orby_live_count(orby_engine_t *engine,
                                      size_t *out_count);

/** @brief Persists all lanes to the configured vault. */
ORBY_API orby_error_t orby_sleep(orby_engine_t *engine);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* ORBY_C_API_H */
