// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace custody {
namespace util {

/**
 * Fixed-size worker pool
 *
 * Exchanges block while they wait for a direct response, so they never run
 * on the I/O thread; the HTTP transport hands each exchange to a pool of
 * this type. The trust-ping responder owns a second pool so that replies are
 * produced independently of the exchange that waits for them.
 *
 * - Exceptions thrown by tasks are counted and logged; the worker survives
 * - Optional queue limit; a full queue rejects new work instead of growing
 * - Destruction drains queued tasks and joins all workers
 *
 * Usage:
 *   ThreadPool pool(4, 0, "exchange");
 *   auto f = pool.enqueue([] { return 42; });
 *   pool.TryPost([] { ... });   // fire-and-forget, false when rejected
 */
class ThreadPool {
public:
  /**
   * @param num_threads Number of worker threads (0 = hardware concurrency)
   * @param max_queue_size Maximum queued tasks (0 = unlimited)
   * @param name Pool name used in log lines
   */
  explicit ThreadPool(size_t num_threads = 0, size_t max_queue_size = 0,
                      std::string name = "pool");

  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  /**
   * Enqueue a task and obtain its result through a future
   * @throws std::runtime_error if pool is stopped or queue is full
   */
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  /**
   * Enqueue a fire-and-forget task
   * @return false if the pool is stopped or the queue is full
   */
  bool TryPost(std::function<void()> task);

  // Stop accepting new tasks (queued tasks still run). Idempotent.
  void shutdown();

  // Join all workers. Call after shutdown().
  void wait_for_completion();

  size_t size() const { return workers_.size(); }

  size_t pending_tasks() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
  }

  bool is_stopped() const { return stop_.load(std::memory_order_acquire); }

  size_t tasks_completed() const {
    return tasks_completed_.load(std::memory_order_relaxed);
  }

  size_t task_exceptions() const {
    return task_exceptions_.load(std::memory_order_relaxed);
  }

  const std::string &name() const { return name_; }

private:
  // Caller must hold queue_mutex_
  bool accepting_locked() const;

  void worker_loop(size_t index);

  std::string name_;
  std::vector<std::thread> workers_;

  std::queue<std::function<void()>> tasks_;
  size_t max_queue_size_; // 0 = unlimited

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::atomic<bool> stop_{false};

  std::atomic<size_t> tasks_completed_{0};
  std::atomic<size_t> task_exceptions_{0};
};

template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (stop_.load(std::memory_order_acquire))
      throw std::runtime_error("enqueue on stopped ThreadPool " + name_);
    if (!accepting_locked())
      throw std::runtime_error("ThreadPool " + name_ + " queue full");
    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return res;
}

} // namespace util
} // namespace custody
