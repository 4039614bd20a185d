#pragma once

#include "runbox/observability/observer.hpp"

#include <memory>

namespace runbox::observability {

/// Process-wide sink used by the `record_*` and `log*` helpers. Null drops everything.
void set_global_observer(std::unique_ptr<IObserver> observer);
void flush_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);
void record_error(const std::string &component, const std::string &message);

void log(LogLevel level, const std::string &component, const std::string &message);
void log_debug(const std::string &component, const std::string &message);
void log_info(const std::string &component, const std::string &message);
void log_warn(const std::string &component, const std::string &message);

} // namespace runbox::observability
