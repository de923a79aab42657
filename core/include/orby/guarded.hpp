#pragma once

#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <utility>

namespace orby {

/**
 * @brief One value behind one reader/writer lock.
 *
 * The only way to touch the value is through read() (shared lock, const
 * access) or write() (exclusive lock, mutable access). Both run the
 * callable under the lock and return whatever it returns, so no reference
 * to the state can escape a critical section by accident.
 */
template <typename T> class Guarded {
public:
  template <typename... Args>
  explicit Guarded(std::in_place_t, Args &&...args)
      : value_(std::forward<Args>(args)...) {}

  Guarded(const Guarded &) = delete;
  Guarded &operator=(const Guarded &) = delete;

  template <typename F>
  auto read(F &&fn) const -> std::invoke_result_t<F, const T &> {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::forward<F>(fn)(value_);
  }

  template <typename F> auto write(F &&fn) -> std::invoke_result_t<F, T &> {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return std::forward<F>(fn)(value_);
  }

private:
  mutable std::shared_mutex mutex_;
  T value_;
};

} // namespace orby
