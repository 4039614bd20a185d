#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "runbox/observability/factory.hpp"
#include "runbox/observability/global.hpp"
#include "runbox/observability/log_observer.hpp"

#include <sstream>

namespace {

class RecordingObserver final : public runbox::observability::IObserver {
public:
  explicit RecordingObserver(std::vector<std::string> &sink) : sink_(sink) {}

  void record_event(const runbox::observability::ObserverEvent &event) override {
    if (const auto *log = std::get_if<runbox::observability::LogEvent>(&event)) {
      sink_.push_back(log->component + ":" + log->message);
    } else if (const auto *error = std::get_if<runbox::observability::ErrorEvent>(&event)) {
      sink_.push_back("error:" + error->message);
    }
  }
  void record_metric(const runbox::observability::ObserverMetric &) override {}
  void flush() override { sink_.push_back("flush"); }
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::vector<std::string> &sink_;
};

} // namespace

void register_observability_tests(std::vector<runbox::tests::TestCase> &tests) {
  using runbox::tests::require;
  namespace obs = runbox::observability;

  tests.push_back({"observability_parse_log_level", [] {
                     require(obs::parse_log_level("DEBUG") == obs::LogLevel::Debug, "debug");
                     require(obs::parse_log_level(" warning ") == obs::LogLevel::Warn, "warning");
                     require(obs::parse_log_level("error") == obs::LogLevel::Error, "error");
                     require(obs::parse_log_level("whatever") == obs::LogLevel::Info,
                             "unknown falls back to info");
                     require(obs::log_level_name(obs::LogLevel::Warn) == "WARN", "level name");
                   }});

  tests.push_back({"observability_log_observer_formats_events", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(obs::LogLevel::Info, out);
                     observer.record_event(obs::SessionOpenedEvent{
                         .session_id = "s1",
                         .image = "alpine:3",
                         .extract_patch = true,
                         .duration = std::chrono::milliseconds(12)});
                     observer.record_event(
                         obs::SessionClosedEvent{.session_id = "s1", .reason = "closed"});
                     observer.record_event(
                         obs::ErrorEvent{.component = "gateway", .message = "boom"});
                     const auto text = out.str();
                     require(text.find("[INFO] session.open id=s1 image=alpine:3 "
                                       "extract_patch=true duration_ms=12") != std::string::npos,
                             "open line: " + text);
                     require(text.find("[INFO] session.close id=s1 reason=closed") !=
                                 std::string::npos,
                             "close line");
                     require(text.find("[ERROR] gateway: boom") != std::string::npos,
                             "error line");
                   }});

  tests.push_back({"observability_log_observer_filters_by_level", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(obs::LogLevel::Warn, out);
                     observer.record_event(obs::CommandEvent{.session_id = "s", .command = "ls"});
                     observer.record_metric(obs::ActiveSessionsMetric{.count = 3});
                     observer.record_event(obs::LogEvent{
                         .level = obs::LogLevel::Info, .component = "x", .message = "quiet"});
                     require(out.str().empty(), "debug and info are dropped at warn");
                     observer.record_event(obs::LogEvent{
                         .level = obs::LogLevel::Warn, .component = "sandbox", .message = "loud"});
                     require(out.str() == "[WARN] [sandbox] loud\n", "warn passes: " + out.str());
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     auto config = runbox::testing::mock_config();
                     require(obs::create_observer(config)->name() == "noop", "none gives noop");
                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     require(obs::parse_observer_backend(" NoOp ") == obs::ObserverBackend::None,
                             "noop alias");
                     require(!obs::parse_observer_backend("statsd").has_value(), "unknown backend");
                   }});

  tests.push_back({"observability_global_helpers_route_to_observer", [] {
                     std::vector<std::string> sink;
                     obs::set_global_observer(std::make_unique<RecordingObserver>(sink));
                     obs::log_info("manager", "hello");
                     obs::record_error("gateway", "bad");
                     obs::flush_global_observer();
                     obs::set_global_observer(nullptr);
                     obs::log_info("manager", "dropped");
                     obs::flush_global_observer();
                     require(sink.size() == 4, "records plus two flushes");
                     require(sink[0] == "manager:hello", "log record");
                     require(sink[1] == "error:bad", "error record");
                     require(sink[2] == "flush" && sink[3] == "flush",
                             "explicit flush and flush on replace");
                   }});
}
