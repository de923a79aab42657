#include "orby/vault.hpp"
#include "orby/hash.hpp"
#include "orby/logging.hpp"
#include "orby/platform.hpp"
#include <algorithm>
#include <cstring>
#include <format>
#include <optional>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace orby {

namespace {

fs::path tmp_path(const fs::path &final_path) {
  fs::path p = final_path;
  p += VAULT_TMP_SUFFIX;
  return p;
}

/// Writes `bytes` to `path`, then fsyncs. Empty error code on success.
std::error_code write_durable(const fs::path &path,
                              std::span<const std::byte> bytes) {
  platform::ScopedFile file(platform::file_create(path));
  if (!file.valid())
    return platform::last_error();
  if (!platform::write_all(file.get(), bytes.data(), bytes.size()))
    return platform::last_error();
  if (!platform::file_sync(file.get()))
    return platform::last_error();
  return {};
}

struct LaneLoad {
  std::error_code cause;
  std::optional<uint64_t> wrong_size;
};

Error vault_error(ErrorKind kind, std::string detail, size_t lane,
                  std::error_code cause) {
  Error err{.kind = kind, .detail = std::move(detail), .lane = lane};
  err.cause = cause;
  return err;
}

} // namespace

// ===========================================================================
// Manifest
// ===========================================================================

VaultManifest Vault::make_manifest(const LaneStore &store) noexcept {
  VaultManifest m;
  std::memset(&m, 0, sizeof(m));
  m.magic = VAULT_MAGIC;
  m.version = VAULT_VERSION;
  m.dimension = static_cast<uint32_t>(store.dimension());
  m.capacity = store.capacity();
  m.cursor = store.position();
  m.length = store.length();
  m.addressing = static_cast<uint8_t>(store.addressing());
  m.deletion = static_cast<uint8_t>(store.deletion());
  m.checksum = hash::fnv1a_64(&m, VAULT_MANIFEST_CHECKED_BYTES);
  return m;
}

bool Vault::manifest_valid(const VaultManifest &m) noexcept {
  return m.magic == VAULT_MAGIC && m.version == VAULT_VERSION &&
         m.checksum == hash::fnv1a_64(&m, VAULT_MANIFEST_CHECKED_BYTES);
}

// ===========================================================================
// Sleep
// ===========================================================================

Result<void> Vault::sleep(const LaneStore &store, ThreadPool &pool) const {
  auto logger = log::logger();
  const size_t dim = store.dimension();

  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    logger->error("vault {}: cannot create directory: {}", dir_.string(),
                  ec.message());
    return std::unexpected(vault_error(ErrorKind::VaultWriteFailed,
                                       "cannot create vault directory", 0,
                                       ec));
  }

  // Phase 1: every lane to its temporary, fsynced, in parallel.
  auto results = parallel_for_each_index(pool, dim, [&](size_t j) {
    return write_durable(tmp_path(lane_path(j)), store.lane(j).bytes());
  });

  auto failed = std::find_if(results.begin(), results.end(),
                             [](const std::error_code &e) { return bool(e); });
  if (failed != results.end()) {
    const auto lane = static_cast<size_t>(failed - results.begin());
    Error err = vault_error(
        ErrorKind::VaultWriteFailed,
        std::format("cannot write {}", lane_path(lane).string()), lane,
        *failed);
    for (size_t j = 0; j < dim; ++j) {
      if (!results[j])
        err.completed_lanes.push_back(j);
      std::error_code ignored;
      fs::remove(tmp_path(lane_path(j)), ignored);
    }
    logger->error("vault {}: sleep aborted, lane {} failed: {}",
                  dir_.string(), lane, failed->message());
    return std::unexpected(std::move(err));
  }

  // Phase 2: retire the old commit record, then swap lanes into place. A
  // crash from here on leaves lane files without a manifest, which load()
  // rejects instead of pairing new lanes with an old cursor.
  const fs::path manifest = manifest_path();
  fs::remove(manifest, ec);
  if (!ec && !platform::dir_sync(dir_))
    ec = platform::last_error();
  if (ec) {
    logger->error("vault {}: cannot retire manifest: {}", dir_.string(),
                  ec.message());
    return std::unexpected(vault_error(ErrorKind::VaultWriteFailed,
                                       "cannot retire previous manifest", 0,
                                       ec));
  }

  for (size_t j = 0; j < dim; ++j) {
    fs::rename(tmp_path(lane_path(j)), lane_path(j), ec);
    if (ec) {
      logger->error("vault {}: cannot install lane {}: {}", dir_.string(), j,
                    ec.message());
      Error err = vault_error(ErrorKind::VaultWriteFailed,
                              std::format("cannot rename lane {} into place",
                                          j),
                              j, ec);
      for (size_t k = 0; k < j; ++k)
        err.completed_lanes.push_back(k);
      for (size_t k = j; k < dim; ++k) {
        std::error_code ignored;
        fs::remove(tmp_path(lane_path(k)), ignored);
      }
      return std::unexpected(std::move(err));
    }
  }

  // Phase 3: commit.
  const VaultManifest m = make_manifest(store);
  ec = write_durable(tmp_path(manifest),
                     std::as_bytes(std::span<const VaultManifest>(&m, 1)));
  if (!ec)
    fs::rename(tmp_path(manifest), manifest, ec);
  if (!ec && !platform::dir_sync(dir_))
    ec = platform::last_error();
  if (ec) {
    logger->error("vault {}: cannot commit manifest: {}", dir_.string(),
                  ec.message());
    Error err = vault_error(ErrorKind::VaultWriteFailed,
                            "cannot commit manifest", 0, ec);
    for (size_t k = 0; k < dim; ++k)
      err.completed_lanes.push_back(k);
    return std::unexpected(std::move(err));
  }

  logger->info("vault {}: slept {} lanes, {} rows, {} bytes", dir_.string(),
               dim, store.length(),
               static_cast<uint64_t>(store.capacity()) * CELL_BYTES * dim);
  return {};
}

// ===========================================================================
// Load
// ===========================================================================

Result<bool> Vault::load(LaneStore &store, ThreadPool &pool) const {
  auto logger = log::logger();
  const size_t dim = store.dimension();
  const uint64_t lane_bytes = static_cast<uint64_t>(store.capacity()) *
                              CELL_BYTES;

  auto corrupt = [&](std::string detail, size_t lane,
                     std::error_code cause) -> std::unexpected<Error> {
    logger->error("vault {}: {}", dir_.string(), detail);
    return std::unexpected(
        vault_error(ErrorKind::VaultCorrupt, std::move(detail), lane, cause));
  };

  std::error_code ec;
  if (!fs::exists(dir_, ec)) {
    if (ec)
      return corrupt("cannot stat vault directory", 0, ec);
    return false;
  }

  const fs::path manifest_file = manifest_path();
  const bool has_manifest = fs::exists(manifest_file, ec);
  if (ec)
    return corrupt(std::format("cannot stat {}", VAULT_MANIFEST_NAME), 0, ec);
  size_t lanes_present = 0;
  for (size_t j = 0; j < dim; ++j) {
    if (fs::exists(lane_path(j), ec))
      ++lanes_present;
    if (ec)
      return corrupt(std::format("cannot stat {}", lane_file_name(j)), j, ec);
  }
  if (!has_manifest && lanes_present == 0)
    return false;
  if (!has_manifest)
    return corrupt("lane files present without vault.meta", 0, {});

  // Manifest
  VaultManifest m;
  {
    platform::ScopedFile file(platform::file_open_read(manifest_file));
    if (!file.valid())
      return corrupt("cannot open vault.meta", 0, platform::last_error());
    uint64_t size = 0;
    if (!platform::file_size(file.get(), size))
      return corrupt("cannot stat vault.meta", 0, platform::last_error());
    if (size != sizeof(VaultManifest))
      return corrupt(std::format("vault.meta is {} bytes, expected {}", size,
                                 sizeof(VaultManifest)),
                     0, {});
    if (!platform::read_all(file.get(), &m, sizeof(m)))
      return corrupt("cannot read vault.meta", 0, platform::last_error());
  }
  if (!manifest_valid(m))
    return corrupt("vault.meta failed magic/version/checksum check", 0, {});

  if (m.capacity != store.capacity() || m.dimension != dim ||
      m.addressing != static_cast<uint8_t>(store.addressing())) {
    auto detail = std::format(
        "vault holds capacity {} x {} lanes ({}), engine is {} x {} ({})",
        m.capacity, m.dimension,
        to_string(static_cast<AddressingMode>(m.addressing)),
        store.capacity(), dim, to_string(store.addressing()));
    logger->error("vault {}: {}", dir_.string(), detail);
    return make_error(ErrorKind::ConfigMismatch, std::move(detail));
  }

  // Lanes, in parallel, straight into the store's buffers.
  auto results = parallel_for_each_index(pool, dim, [&](size_t j) {
    LaneLoad out;
    platform::ScopedFile file(platform::file_open_read(lane_path(j)));
    if (!file.valid()) {
      out.cause = platform::last_error();
      return out;
    }
    uint64_t size = 0;
    if (!platform::file_size(file.get(), size)) {
      out.cause = platform::last_error();
      return out;
    }
    if (size != lane_bytes) {
      out.wrong_size = size;
      return out;
    }
    auto dst = store.lane(j).writable_bytes();
    if (!platform::read_all(file.get(), dst.data(), dst.size()))
      out.cause = platform::last_error();
    return out;
  });

  for (size_t j = 0; j < dim; ++j) {
    if (results[j].wrong_size) {
      return corrupt(std::format("{} is {} bytes, expected {}",
                                 lane_file_name(j), *results[j].wrong_size,
                                 lane_bytes),
                     j, {});
    }
    if (results[j].cause) {
      return corrupt(std::format("cannot read {}", lane_file_name(j)), j,
                     results[j].cause);
    }
  }

  if (auto ok = store.restore_cursor(m.cursor, m.length); !ok) {
    logger->error("vault {}: {}", dir_.string(), ok.error().detail);
    return std::unexpected(std::move(ok.error()));
  }

  logger->info("vault {}: loaded {} lanes, {} rows ({} live), {} bytes",
               dir_.string(), dim, store.length(), store.live_count(),
               lane_bytes * dim);
  return true;
}

} // namespace orby
