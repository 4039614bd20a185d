#include "runbox/observability/factory.hpp"

#include "runbox/common/fs.hpp"
#include "runbox/observability/log_observer.hpp"

namespace runbox::observability {

namespace {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace

std::optional<ObserverBackend> parse_observer_backend(const std::string_view text) {
  const std::string normalized = common::to_lower(common::trim(std::string(text)));
  if (normalized == "log") {
    return ObserverBackend::Log;
  }
  if (normalized == "none" || normalized == "noop") {
    return ObserverBackend::None;
  }
  return std::nullopt;
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto backend = parse_observer_backend(config.observability.backend);
  if (backend == ObserverBackend::None) {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>(parse_log_level(config.observability.log_level));
}

} // namespace runbox::observability
