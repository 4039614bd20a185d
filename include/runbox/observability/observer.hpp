#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace runbox::observability {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] LogLevel parse_log_level(std::string_view text);
[[nodiscard]] std::string_view log_level_name(LogLevel level);

struct SessionOpenedEvent {
  std::string session_id;
  std::string image;
  bool extract_patch = false;
  std::chrono::milliseconds duration{0};
};

struct SessionClosedEvent {
  std::string session_id;
  std::string reason;
};

struct CommandEvent {
  std::string session_id;
  std::string command;
  int exit_code = 0;
  bool timed_out = false;
  std::chrono::milliseconds duration{0};
};

struct PatchEvent {
  std::string session_id;
  std::size_t changed_files = 0;
  std::size_t removed_files = 0;
  std::size_t patch_bytes = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

struct LogEvent {
  LogLevel level = LogLevel::Info;
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SessionOpenedEvent, SessionClosedEvent, CommandEvent,
                                   PatchEvent, ErrorEvent, LogEvent>;

struct RequestLatencyMetric {
  std::string route;
  int status = 0;
  std::chrono::milliseconds latency{0};
};

struct CommandLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, CommandLatencyMetric, ActiveSessionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace runbox::observability
