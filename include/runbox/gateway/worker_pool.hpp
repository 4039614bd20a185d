#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace runbox::gateway {

/// Fixed set of threads draining a FIFO of jobs.
class WorkerPool {
public:
  using Job = std::function<void()>;

  WorkerPool() = default;
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  void start(std::size_t workers);
  /// False once the pool is stopping; the job is not queued.
  [[nodiscard]] bool submit(Job job);
  /// Runs the jobs already queued, then joins every worker.
  void stop();

  [[nodiscard]] std::size_t pending() const;
  [[nodiscard]] std::size_t size() const;

private:
  void worker_loop();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<Job> queue_;
  std::vector<std::thread> threads_;
  bool accepting_ = false;
};

} // namespace runbox::gateway
