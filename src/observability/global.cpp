#include "runbox/observability/global.hpp"

#include <mutex>
#include <utility>

namespace runbox::observability {

namespace {

struct GlobalSink {
  std::mutex mutex;
  std::shared_ptr<IObserver> observer;
};

GlobalSink &sink() {
  static GlobalSink instance;
  return instance;
}

// Callers keep their own reference so a concurrent replace cannot free the observer mid-call.
std::shared_ptr<IObserver> snapshot() {
  auto &global = sink();
  std::lock_guard<std::mutex> lock(global.mutex);
  return global.observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    auto &global = sink();
    std::lock_guard<std::mutex> lock(global.mutex);
    previous = std::exchange(global.observer, std::shared_ptr<IObserver>(std::move(observer)));
  }
  if (previous != nullptr) {
    previous->flush();
  }
}

void flush_global_observer() {
  if (auto observer = snapshot(); observer != nullptr) {
    observer->flush();
  }
}

void record_event(const ObserverEvent &event) {
  if (auto observer = snapshot(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = snapshot(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void log(const LogLevel level, const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = level, .component = component, .message = message});
}

void log_debug(const std::string &component, const std::string &message) {
  log(LogLevel::Debug, component, message);
}

void log_info(const std::string &component, const std::string &message) {
  log(LogLevel::Info, component, message);
}

void log_warn(const std::string &component, const std::string &message) {
  log(LogLevel::Warn, component, message);
}

} // namespace runbox::observability
