#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "runbox/config/config.hpp"

#include <filesystem>

namespace {

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(std::filesystem::path path) {
    runbox::config::set_config_path_override(std::move(path));
  }
  ~ConfigOverrideGuard() { runbox::config::set_config_path_override(std::nullopt); }
};

} // namespace

void register_config_tests(std::vector<runbox::tests::TestCase> &tests) {
  using runbox::tests::require;
  namespace cfg = runbox::config;
  using runbox::testing::EnvGuard;
  using runbox::testing::TempWorkspace;

  tests.push_back({"config_defaults_are_valid_locally", [] {
                     cfg::Config config;
                     require(config.environment == "local", "default environment");
                     require(config.server.port == 8000, "default port");
                     require(config.server.api_prefix == "/api/v1", "default prefix");
                     require(config.sandbox.runtime == "runc", "default runtime");
                     require(config.sandbox.max_execution_time_secs == 600, "default budget");
                     require(config.sandbox.default_network_enabled, "network on by default");
                     auto validated = cfg::validate_config(config);
                     require(validated.ok(), "defaults should validate: " + validated.error());
                     require(!validated.value().empty(), "empty api key produces a warning");
                   }});

  tests.push_back({"config_parse_reads_every_section", [] {
                     auto parsed = cfg::parse_config("environment = \"production\"\n"
                                                     "[server]\n"
                                                     "port = 9100\n"
                                                     "api_key = \"secret\"\n"
                                                     "workers = 3\n"
                                                     "[sandbox]\n"
                                                     "runtime = \"runsc\"\n"
                                                     "max_execution_time = 120\n"
                                                     "keep_template = true\n"
                                                     "helper_image = \"busybox:1\"\n"
                                                     "start_retries = 5\n"
                                                     "session_idle_timeout = 60\n"
                                                     "network_enabled = false\n"
                                                     "[observability]\n"
                                                     "log_level = \"debug\"\n"
                                                     "[error_tracking]\n"
                                                     "traces_sample_rate = 0.5\n");
                     require(parsed.ok(), "config should parse: " + parsed.error());
                     const auto &config = parsed.value();
                     require(config.environment == "production", "environment");
                     require(config.server.port == 9100, "port");
                     require(config.server.api_key == "secret", "api key");
                     require(config.server.workers == 3, "workers");
                     require(config.sandbox.runtime == "runsc", "runtime");
                     require(config.sandbox.max_execution_time_secs == 120, "budget");
                     require(config.sandbox.keep_template, "keep_template");
                     require(config.sandbox.helper_image == "busybox:1", "helper image");
                     require(config.sandbox.start_retries == 5, "start retries");
                     require(config.sandbox.session_idle_timeout_secs == 60, "idle timeout");
                     require(!config.sandbox.default_network_enabled, "network default");
                     require(config.observability.log_level == "debug", "log level");
                     require(config.error_tracking.traces_sample_rate == 0.5, "sample rate");
                     require(cfg::validate_config(config).ok(), "parsed config validates");
                   }});

  tests.push_back({"config_out_of_range_values_fall_back", [] {
                     auto parsed = cfg::parse_config("[server]\nport = 70000\n");
                     require(parsed.ok(), "config should parse");
                     require(parsed.value().server.port == 8000,
                             "port beyond uint16 keeps the default");
                   }});

  tests.push_back({"config_env_overrides_win", [] {
                     EnvGuard key("RUNBOX_API_KEY", "from-env");
                     EnvGuard runtime("RUNBOX_RUNTIME", "RUNSC");
                     EnvGuard budget("RUNBOX_MAX_EXECUTION_TIME", "45");
                     EnvGuard keep("RUNBOX_KEEP_TEMPLATE", "yes");
                     EnvGuard port("RUNBOX_PORT", "not-a-number");
                     EnvGuard network("RUNBOX_NETWORK_ENABLED", "false");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.server.api_key == "from-env", "api key override");
                     require(config.sandbox.runtime == "runsc", "runtime is lower-cased");
                     require(config.sandbox.max_execution_time_secs == 45, "budget override");
                     require(config.sandbox.keep_template, "bool override");
                     require(config.server.port == 8000, "unparsable port is ignored");
                     require(!config.sandbox.default_network_enabled, "network override");
                   }});

  tests.push_back({"config_validation_rejects_bad_values", [] {
                     auto expect_invalid = [](cfg::Config config, const std::string &what) {
                       auto result = cfg::validate_config(config);
                       require(!result.ok(), what + " should be rejected");
                       require(result.code() == runbox::common::ErrorCode::InvalidArgument,
                               what + " should be InvalidArgument");
                     };
                     cfg::Config base;
                     base.server.api_key = "k";

                     auto env = base;
                     env.environment = "dev";
                     expect_invalid(env, "environment");
                     auto runtime = base;
                     runtime.sandbox.runtime = "kata";
                     expect_invalid(runtime, "runtime");
                     auto budget = base;
                     budget.sandbox.max_execution_time_secs = 0;
                     expect_invalid(budget, "zero budget");
                     auto workers = base;
                     workers.server.workers = 0;
                     expect_invalid(workers, "zero workers");
                     auto backend = base;
                     backend.observability.backend = "statsd";
                     expect_invalid(backend, "observer backend");
                     auto level = base;
                     level.observability.log_level = "loud";
                     expect_invalid(level, "log level");
                     auto rate = base;
                     rate.error_tracking.traces_sample_rate = 1.5;
                     expect_invalid(rate, "sample rate");
                     auto prefix = base;
                     prefix.server.api_prefix = "api";
                     expect_invalid(prefix, "api prefix");
                     auto keyless = base;
                     keyless.environment = "production";
                     keyless.server.api_key.clear();
                     expect_invalid(keyless, "missing api key in production");
                   }});

  tests.push_back({"config_load_uses_override_path", [] {
                     TempWorkspace workspace;
                     workspace.create_file("config.toml", "[server]\nport = 8123\n");
                     EnvGuard port("RUNBOX_PORT", std::nullopt);
                     EnvGuard env_file("RUNBOX_ENV_FILE", std::nullopt);
                     ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     auto path = cfg::config_path();
                     require(path.ok() && path.value() == workspace.path() / "config.toml",
                             "override path is used");
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), "load should succeed: " + loaded.error());
                     require(loaded.value().server.port == 8123, "file value is applied");
                   }});

  tests.push_back({"config_load_reports_parse_errors", [] {
                     TempWorkspace workspace;
                     workspace.create_file("config.toml", "[server\nport 1\n");
                     ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     auto loaded = cfg::load_config();
                     require(!loaded.ok(), "malformed file should fail");
                     require(loaded.error().find("config.toml") != std::string::npos,
                             "error names the file");
                   }});

  tests.push_back({"config_missing_file_uses_defaults", [] {
                     TempWorkspace workspace;
                     EnvGuard port("RUNBOX_PORT", std::nullopt);
                     ConfigOverrideGuard guard(workspace.path() / "absent.toml");
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), "missing file is not an error");
                     require(loaded.value().server.port == 8000, "defaults apply");
                   }});

  tests.push_back({"config_sentry_dsn_is_accepted_with_warning", [] {
                     cfg::Config config;
                     config.server.api_key = "key";
                     auto quiet = cfg::validate_config(config);
                     require(quiet.ok() && quiet.value().empty(), "no warnings without a dsn");

                     config.error_tracking.sentry_dsn = "https://public@sentry.example/1";
                     auto warned = cfg::validate_config(config);
                     require(warned.ok(), "a dsn never fails validation");
                     require(warned.value().size() == 1 &&
                                 warned.value()[0].find("sentry_dsn") != std::string::npos,
                             "dsn reported as unused");
                   }});
}
