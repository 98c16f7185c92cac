#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace toolwire::mcp {

// Fixed set of threads running handler invocations off the read loop.
// With zero threads, submit() runs the task on the calling thread.
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Tasks must not throw. Returns false once the pool is stopping.
  bool submit(std::function<void()> task);

  // Runs every queued task to completion, then joins the threads. Idempotent.
  void drain_and_stop();

  [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }
  [[nodiscard]] std::size_t pending() const;

 private:
  void worker_loop();

  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<std::function<void()>> queue_;
  std::vector<std::thread> threads_;
  bool stopping_{false};
};

}  // namespace toolwire::mcp
