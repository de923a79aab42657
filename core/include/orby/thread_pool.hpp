#pragma once

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool for request-scoped fan-out.
 *
 * Every engine call that fans out (chunked scan, per-lane vault I/O,
 * per-lane compaction) submits its units of work here and joins all the
 * returned futures before it returns. Tasks must not wait on other tasks
 * of the same pool.
 */

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace orby {

class ThreadPool {
public:
  /// @throws std::system_error if a worker thread cannot be started.
  explicit ThreadPool(size_t workers) {
    if (workers == 0)
      workers = 1;
    threads_.reserve(workers);
    try {
      for (size_t i = 0; i < workers; ++i) {
        threads_.emplace_back([this] { worker_loop(); });
      }
    } catch (...) {
      // Join the workers already running before the error propagates.
      stop();
      throw;
    }
  }

  ~ThreadPool() { stop(); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /**
   * @brief Queues a no-arg callable.
   * Exceptions thrown by the callable surface through the future.
   * @throws std::runtime_error if the pool has been stopped.
   */
  template <typename F>
  auto submit(F &&fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    std::future<R> fut = task->get_future();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_)
        throw std::runtime_error("ThreadPool: submit on stopped pool");
      tasks_.emplace_back([task]() { (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }

  /// Drains queued tasks, then joins every worker. Idempotent.
  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_)
        return;
      stopping_ = true;
    }
    cv_.notify_all();
    for (auto &t : threads_) {
      if (t.joinable())
        t.join();
    }
  }

  size_t size() const noexcept { return threads_.size(); }

private:
  void worker_loop() {
    while (true) {
      std::function<void()> job;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
        if (tasks_.empty())
          return; // stopping and drained
        job = std::move(tasks_.front());
        tasks_.pop_front();
      }
      // packaged_task stores any exception in its shared state.
      job();
    }
  }

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> tasks_;
  std::vector<std::thread> threads_;
  bool stopping_ = false;
};

/**
 * @brief Runs fn(i) for i in [0, count) on the pool and joins them all.
 *
 * Results come back in index order regardless of completion order. When
 * count <= 1 the work runs inline on the calling thread.
 */
template <typename F>
auto parallel_for_each_index(ThreadPool &pool, size_t count, F fn)
    -> std::vector<std::invoke_result_t<F &, size_t>> {
  using R = std::invoke_result_t<F &, size_t>;
  std::vector<R> results;
  results.reserve(count);
  if (count <= 1) {
    for (size_t i = 0; i < count; ++i)
      results.push_back(fn(i));
    return results;
  }

  std::vector<std::future<R>> futures;
  futures.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    futures.push_back(pool.submit([&fn, i]() { return fn(i); }));
  }
  // Join every future before rethrowing so no task outlives fn.
  std::exception_ptr first_failure;
  for (auto &f : futures) {
    try {
      results.push_back(f.get());
    } catch (...) {
      if (!first_failure)
        first_failure = std::current_exception();
    }
  }
  if (first_failure)
    std::rethrow_exception(first_failure);
  return results;
}

} // namespace orby
