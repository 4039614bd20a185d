#include "runbox/gateway/worker_pool.hpp"

#include <algorithm>

namespace runbox::gateway {

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start(const std::size_t workers) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (accepting_ || !threads_.empty()) {
    return;
  }
  accepting_ = true;
  const std::size_t count = std::max<std::size_t>(1, workers);
  threads_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    threads_.emplace_back([this]() { worker_loop(); });
  }
}

bool WorkerPool::submit(Job job) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!accepting_) {
    return false;
  }
  queue_.push(std::move(job));
  cv_.notify_one();
  return true;
}

void WorkerPool::stop() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = false;
    threads.swap(threads_);
  }
  cv_.notify_all();
  for (auto &thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

std::size_t WorkerPool::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::size_t WorkerPool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return threads_.size();
}

void WorkerPool::worker_loop() {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return !accepting_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      job = std::move(queue_.front());
      queue_.pop();
    }
    job();
  }
}

} // namespace runbox::gateway
