#include "runbox/observability/log_observer.hpp"

#include "runbox/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace runbox::observability {

LogLevel parse_log_level(const std::string_view text) {
  const std::string level = common::to_lower(common::trim(std::string(text)));
  if (level == "debug" || level == "trace") {
    return LogLevel::Debug;
  }
  if (level == "warn" || level == "warning") {
    return LogLevel::Warn;
  }
  if (level == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SessionOpenedEvent>) {
          log_line(LogLevel::Info, "session.open id=" + evt.session_id + " image=" + evt.image +
                                       " extract_patch=" + (evt.extract_patch ? "true" : "false") +
                                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SessionClosedEvent>) {
          log_line(LogLevel::Info, "session.close id=" + evt.session_id + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, CommandEvent>) {
          log_line(LogLevel::Debug,
                   "command.exec session=" + evt.session_id +
                       " exit_code=" + std::to_string(evt.exit_code) +
                       " timed_out=" + (evt.timed_out ? "true" : "false") +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, PatchEvent>) {
          log_line(LogLevel::Debug, "patch.extract session=" + evt.session_id +
                                        " changed=" + std::to_string(evt.changed_files) +
                                        " removed=" + std::to_string(evt.removed_files) +
                                        " bytes=" + std::to_string(evt.patch_bytes));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, LogEvent>) {
          log_line(evt.level, "[" + evt.component + "] " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.request route=" + m.route +
                                        " status=" + std::to_string(m.status) +
                                        " latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CommandLatencyMetric>) {
          log_line(LogLevel::Debug,
                   "metric.command_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line(LogLevel::Debug, "metric.active_sessions=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace runbox::observability
