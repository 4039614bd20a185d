#pragma once

#include <atomic>

namespace runbox::common {

/// Cooperative cancellation flag shared between a requester and a worker.
class CancellationToken {
public:
  void cancel() { cancelled_.store(true); }
  void reset() { cancelled_.store(false); }
  [[nodiscard]] bool cancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace runbox::common
