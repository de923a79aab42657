#pragma once

#include "orby/error.hpp"
#include "orby/lane_store.hpp"
#include "orby/schema.hpp"
#include "orby/thread_pool.hpp"
#include <filesystem>
#include <utility>

namespace orby {

/**
 * @brief On-disk mirror of a LaneStore: one raw file per lane plus a
 * 64-byte manifest.
 *
 * Directory layout:
 *   lane_0.bin ... lane_<d-1>.bin   capacity * 16 bytes each, no header
 *   vault.meta                      VaultManifest, written last
 *
 * The caller must hold exclusive access to the store for the whole call.
 * The directory is assumed to belong to one engine at a time.
 */
class Vault {
public:
  explicit Vault(std::filesystem::path dir) : dir_(std::move(dir)) {}

  const std::filesystem::path &dir() const noexcept { return dir_; }

  std::filesystem::path lane_path(size_t lane) const {
    return dir_ / lane_file_name(lane);
  }
  std::filesystem::path manifest_path() const {
    return dir_ / VAULT_MANIFEST_NAME;
  }

  /**
   * @brief Persists every lane durably.
   *
   * Each lane is written to a temporary file and fsynced on the pool. Only
   * when all of them succeeded are the temporaries renamed into place and
   * the manifest committed. On a lane failure every temporary is removed,
   * the previous vault stays as it was, and VaultWriteFailed names the lane,
   * the OS error and the lanes that had completed.
   */
  Result<void> sleep(const LaneStore &store, ThreadPool &pool) const;

  /**
   * @brief Loads a previously slept vault into an empty store.
   * @return false when there is nothing to load (first run).
   */
  Result<bool> load(LaneStore &store, ThreadPool &pool) const;

  /// Builds the manifest for the store's current shape and cursor.
  static VaultManifest make_manifest(const LaneStore &store) noexcept;

  /// Magic, version and checksum check.
  static bool manifest_valid(const VaultManifest &m) noexcept;

private:
  std::filesystem::path dir_;
};

} // namespace orby
