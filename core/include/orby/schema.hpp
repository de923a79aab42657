#pragma once

#include "orby/cell.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

namespace orby {

// ═══════════════════════════════════════════════════════════════════════════
// Magic & Version
// ═══════════════════════════════════════════════════════════════════════════

/// Magic: the bytes "ORBYVLT1" on disk, read as a little-endian u64.
constexpr uint64_t VAULT_MAGIC = 0x31544C565942524FULL;

/// Manifest format version.
constexpr uint32_t VAULT_VERSION = 1;

// ═══════════════════════════════════════════════════════════════════════════
// File Names
// ═══════════════════════════════════════════════════════════════════════════

constexpr const char *VAULT_MANIFEST_NAME = "vault.meta";
constexpr const char *VAULT_TMP_SUFFIX = ".tmp";

/// "lane_<index>.bin"
inline std::string lane_file_name(size_t lane) {
  return "lane_" + std::to_string(lane) + ".bin";
}

// ═══════════════════════════════════════════════════════════════════════════
// Scan Chunking
// ═══════════════════════════════════════════════════════════════════════════

/// Bounds for rows per scan chunk.
constexpr size_t SCAN_CHUNK_MIN_ROWS = 512;
constexpr size_t SCAN_CHUNK_MAX_ROWS = 8192;

/// Cache size assumed when the host reports none.
constexpr size_t SCAN_CACHE_FALLBACK_BYTES = 32ULL * 1024 * 1024;

/// Compaction fans out per lane only when the shifted suffix is at least this
/// many rows.
constexpr size_t PARALLEL_SHIFT_MIN_ROWS = 64 * 1024;

/**
 * @brief Rows per scan chunk: clamp(cache / (16 * dimension) / workers).
 *
 * `cache_bytes` is the last-level cache size; 0 selects
 * SCAN_CACHE_FALLBACK_BYTES.
 */
constexpr size_t scan_chunk_rows(size_t dimension, size_t workers,
                                 size_t cache_bytes) noexcept {
  if (dimension == 0)
    dimension = 1;
  if (workers == 0)
    workers = 1;
  if (cache_bytes == 0)
    cache_bytes = SCAN_CACHE_FALLBACK_BYTES;
  size_t rows = cache_bytes / (CELL_BYTES * dimension) / workers;
  if (rows < SCAN_CHUNK_MIN_ROWS)
    return SCAN_CHUNK_MIN_ROWS;
  if (rows > SCAN_CHUNK_MAX_ROWS)
    return SCAN_CHUNK_MAX_ROWS;
  return rows;
}

// ═══════════════════════════════════════════════════════════════════════════
// VaultManifest: 64-byte commit record
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Contents of vault.meta.
 *
 * Written last by sleep(): lane files without a valid manifest are never
 * trusted. Carries the cursor state the raw lane files cannot encode.
 * Integers are stored in host byte order (little-endian on every supported
 * target).
 */
struct alignas(64) VaultManifest {
  uint64_t magic;       // 0x00: VAULT_MAGIC
  uint32_t version;     // 0x08: VAULT_VERSION
  uint32_t dimension;   // 0x0C: Lane count
  uint64_t capacity;    // 0x10: Rows per lane
  uint64_t cursor;      // 0x18: Next write position
  uint64_t length;      // 0x20: Occupied rows
  uint8_t addressing;   // 0x28: AddressingMode
  uint8_t deletion;     // 0x29: DeletionPolicy
  uint8_t reserved[6];  // 0x2A: Zero
  uint8_t reserved2[8]; // 0x30: Zero
  uint64_t checksum;    // 0x38: FNV-1a 64 over bytes [0x00, 0x38)
};

static_assert(sizeof(VaultManifest) == 64, "VaultManifest must be 64 bytes");
static_assert(offsetof(VaultManifest, capacity) == 0x10);
static_assert(offsetof(VaultManifest, addressing) == 0x28);
static_assert(offsetof(VaultManifest, checksum) == 0x38);
static_assert(std::is_trivially_copyable_v<VaultManifest>);

/// Byte count covered by VaultManifest::checksum.
constexpr size_t VAULT_MANIFEST_CHECKED_BYTES =
    offsetof(VaultManifest, checksum);

} // namespace orby
