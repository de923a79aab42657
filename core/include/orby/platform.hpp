#pragma once

/**
 * @file platform.hpp
 * @brief Thin OS abstraction for the vault's durable file I/O.
 *
 * Provides a unified API over:
 *   - POSIX:   open(), write(), read(), fsync() (Linux/macOS)
 *   - Win32:   CreateFile(), WriteFile(), FlushFileBuffers()
 *
 * It also answers the two host questions the engine sizes itself by:
 * available physical memory and last-level cache size.
 *
 * All platform-specific headers and syscalls are confined to this single
 * translation boundary. The rest of Orby only uses the orby::platform:: API.
 * Every fallible call returns false / INVALID_FILE_HANDLE and leaves the
 * reason in last_error().
 */

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

// ============================================================================
// Platform-specific includes
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
#define ORBY_PLATFORM_WINDOWS 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#define ORBY_PLATFORM_POSIX 1
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace orby::platform {

// ============================================================================
// File Handle Abstraction
// ============================================================================

#if defined(ORBY_PLATFORM_WINDOWS)
using FileHandle = HANDLE;
inline const FileHandle INVALID_FILE_HANDLE = INVALID_HANDLE_VALUE;
#else
using FileHandle = int;
inline constexpr FileHandle INVALID_FILE_HANDLE = -1;
#endif

/// The error left behind by the last failed call on this thread.
inline std::error_code last_error() {
#if defined(ORBY_PLATFORM_WINDOWS)
  return {static_cast<int>(GetLastError()), std::system_category()};
#else
  return {errno, std::generic_category()};
#endif
}

// ============================================================================
// File Operations
// ============================================================================

/**
 * @brief Create (or truncate) a file for writing.
 * @return File handle or INVALID_FILE_HANDLE on failure.
 */
inline FileHandle file_create(const std::filesystem::path &path,
                              [[maybe_unused]] int mode = 0644) {
#if defined(ORBY_PLATFORM_WINDOWS)
  return CreateFileW(path.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                     FILE_ATTRIBUTE_NORMAL, nullptr);
#else
  return ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
#endif
}

/**
 * @brief Open an existing file read-only.
 * @return File handle or INVALID_FILE_HANDLE on failure.
 */
inline FileHandle file_open_read(const std::filesystem::path &path) {
#if defined(ORBY_PLATFORM_WINDOWS)
  return CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr,
                     OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
#else
  return ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
#endif
}

/**
 * @brief Close a file handle.
 */
inline void file_close(FileHandle h) {
  if (h == INVALID_FILE_HANDLE)
    return;
#if defined(ORBY_PLATFORM_WINDOWS)
  CloseHandle(h);
#else
  ::close(h);
#endif
}

/**
 * @brief Get the size of an open file.
 * @return true on success; size is written to `out`.
 */
inline bool file_size(FileHandle h, uint64_t &out) {
#if defined(ORBY_PLATFORM_WINDOWS)
  LARGE_INTEGER sz;
  if (!GetFileSizeEx(h, &sz))
    return false;
  out = static_cast<uint64_t>(sz.QuadPart);
  return true;
#else
  struct stat sb;
  if (fstat(h, &sb) == -1)
    return false;
  out = static_cast<uint64_t>(sb.st_size);
  return true;
#endif
}

/**
 * @brief Write the whole buffer, retrying short writes and EINTR.
 * @return true once every byte has been handed to the OS.
 */
inline bool write_all(FileHandle h, const void *data, size_t size) {
  const auto *p = static_cast<const uint8_t *>(data);
  while (size > 0) {
#if defined(ORBY_PLATFORM_WINDOWS)
    DWORD chunk = size > 0x40000000 ? 0x40000000 : static_cast<DWORD>(size);
    DWORD written = 0;
    if (!WriteFile(h, p, chunk, &written, nullptr))
      return false;
    size_t n = written;
#else
    ssize_t n = ::write(h, p, size);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
#endif
    p += n;
    size -= static_cast<size_t>(n);
  }
  return true;
}

/**
 * @brief Read exactly `size` bytes.
 * @return false on I/O error or premature end of file (errno = EIO).
 */
inline bool read_all(FileHandle h, void *data, size_t size) {
  auto *p = static_cast<uint8_t *>(data);
  while (size > 0) {
#if defined(ORBY_PLATFORM_WINDOWS)
    DWORD chunk = size > 0x40000000 ? 0x40000000 : static_cast<DWORD>(size);
    DWORD got = 0;
    if (!ReadFile(h, p, chunk, &got, nullptr))
      return false;
    if (got == 0) {
      SetLastError(ERROR_HANDLE_EOF);
      return false;
    }
    size_t n = got;
#else
    ssize_t n = ::read(h, p, size);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    if (n == 0) {
      errno = EIO;
      return false;
    }
#endif
    p += n;
    size -= static_cast<size_t>(n);
  }
  return true;
}

/**
 * @brief Flush file contents and metadata to stable storage.
 */
inline bool file_sync(FileHandle h) {
#if defined(ORBY_PLATFORM_WINDOWS)
  return FlushFileBuffers(h) != 0;
#else
  while (::fsync(h) != 0) {
    if (errno != EINTR)
      return false;
  }
  return true;
#endif
}

/**
 * @brief Make renames inside `dir` durable.
 * No-op on Windows, where directory entries cannot be fsynced.
 */
inline bool dir_sync([[maybe_unused]] const std::filesystem::path &dir) {
#if defined(ORBY_PLATFORM_WINDOWS)
  return true;
#else
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0)
    return false;
  bool ok = file_sync(fd);
  int saved = errno;
  ::close(fd);
  errno = saved;
  return ok;
#endif
}

// ============================================================================
// RAII owner
// ============================================================================

/// Closes the handle on scope exit.
class ScopedFile {
public:
  explicit ScopedFile(FileHandle h) noexcept : h_(h) {}
  ~ScopedFile() { file_close(h_); }

  ScopedFile(const ScopedFile &) = delete;
  ScopedFile &operator=(const ScopedFile &) = delete;

  FileHandle get() const noexcept { return h_; }
  bool valid() const noexcept { return h_ != INVALID_FILE_HANDLE; }

private:
  FileHandle h_;
};

// ============================================================================
// Host information
// ============================================================================

/**
 * @brief Physical memory the OS could hand out now without swapping.
 * @return Bytes, or 0 when the host does not say.
 */
inline uint64_t available_memory_bytes() {
#if defined(ORBY_PLATFORM_WINDOWS)
  MEMORYSTATUSEX status;
  status.dwLength = sizeof(status);
  if (!GlobalMemoryStatusEx(&status))
    return 0;
  return static_cast<uint64_t>(status.ullAvailPhys);
#else
#if defined(__linux__)
  // MemAvailable counts reclaimable page cache; _SC_AVPHYS_PAGES does not.
  std::ifstream meminfo("/proc/meminfo");
  std::string key;
  uint64_t kib = 0;
  std::string unit;
  while (meminfo >> key >> kib >> unit) {
    if (key == "MemAvailable:")
      return kib * 1024;
  }
#endif
#if defined(_SC_AVPHYS_PAGES)
  const long pages = ::sysconf(_SC_AVPHYS_PAGES);
  const long page_size = ::sysconf(_SC_PAGE_SIZE);
  if (pages > 0 && page_size > 0)
    return static_cast<uint64_t>(pages) * static_cast<uint64_t>(page_size);
#endif
  return 0;
#endif
}

/**
 * @brief Size of the last-level data cache: L3, else L2.
 * @return Bytes, or 0 when the host does not say.
 */
inline size_t last_level_cache_bytes() {
#if defined(ORBY_PLATFORM_WINDOWS)
  DWORD len = 0;
  GetLogicalProcessorInformation(nullptr, &len);
  if (len == 0)
    return 0;
  std::vector<SYSTEM_LOGICAL_PROCESSOR_INFORMATION> info(
      len / sizeof(SYSTEM_LOGICAL_PROCESSOR_INFORMATION));
  if (!GetLogicalProcessorInformation(info.data(), &len))
    return 0;
  size_t l2 = 0, l3 = 0;
  for (const auto &entry : info) {
    if (entry.Relationship != RelationCache)
      continue;
    if (entry.Cache.Level == 3)
      l3 = std::max<size_t>(l3, entry.Cache.Size);
    else if (entry.Cache.Level == 2)
      l2 = std::max<size_t>(l2, entry.Cache.Size);
  }
  return l3 != 0 ? l3 : l2;
#else
#if defined(_SC_LEVEL3_CACHE_SIZE)
  if (long l3 = ::sysconf(_SC_LEVEL3_CACHE_SIZE); l3 > 0)
    return static_cast<size_t>(l3);
#endif
#if defined(_SC_LEVEL2_CACHE_SIZE)
  if (long l2 = ::sysconf(_SC_LEVEL2_CACHE_SIZE); l2 > 0)
    return static_cast<size_t>(l2);
#endif
  return 0;
#endif
}

} // namespace orby::platform
