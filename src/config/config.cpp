#include "runbox/config/config.hpp"

#include "runbox/common/fs.hpp"
#include "runbox/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace runbox::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".runbox";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      out.push_back(ch == 'n' ? '\n' : ch == 't' ? '\t' : ch);
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty() ||
      !(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!key.empty()) {
      set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
    }
  }
}

// Earlier files win because set_env_if_missing never overwrites.
void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("RUNBOX_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }
  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

template <typename T> void env_unsigned(const char *name, T &target) {
  if (auto raw = env_value(name); raw.has_value()) {
    if (auto parsed = common::parse_int(*raw);
        parsed.has_value() && *parsed >= 0 &&
        static_cast<std::uint64_t>(*parsed) <= std::numeric_limits<T>::max()) {
      target = static_cast<T>(*parsed);
    }
  }
}

void env_bool(const char *name, bool &target) {
  if (auto raw = env_value(name); raw.has_value()) {
    if (auto parsed = common::parse_bool(*raw); parsed.has_value()) {
      target = *parsed;
    }
  }
}

template <typename T>
T toml_unsigned(const common::TomlTable &doc, const std::string &key, const T fallback) {
  const auto value = doc.int_or(key, static_cast<std::int64_t>(fallback));
  if (value < 0 || static_cast<std::uint64_t>(value) > std::numeric_limits<T>::max()) {
    return fallback;
  }
  return static_cast<T>(value);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (g_config_path_override.has_value()) {
    return common::Result<std::filesystem::path>::success(g_config_path_override->parent_path());
  }
  if (auto env = env_value("RUNBOX_CONFIG_PATH"); env.has_value()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(*env)).parent_path());
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (g_config_path_override.has_value()) {
    return common::Result<std::filesystem::path>::success(*g_config_path_override);
  }
  if (auto env = env_value("RUNBOX_CONFIG_PATH"); env.has_value()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(*env)));
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::propagate(parsed);
  }
  const auto &doc = parsed.value();
  Config config;

  config.environment = doc.string_or("environment", config.environment);

  auto &server = config.server;
  server.host = doc.string_or("server.host", server.host);
  server.port = toml_unsigned<std::uint16_t>(doc, "server.port", server.port);
  server.api_prefix = doc.string_or("server.api_prefix", server.api_prefix);
  server.api_key = common::expand_path(doc.string_or("server.api_key", server.api_key));
  server.max_body_bytes =
      toml_unsigned<std::size_t>(doc, "server.max_body_bytes", server.max_body_bytes);
  server.workers = toml_unsigned<std::size_t>(doc, "server.workers", server.workers);

  auto &sandbox = config.sandbox;
  sandbox.runtime = doc.string_or("sandbox.runtime", sandbox.runtime);
  sandbox.docker_host = doc.string_or("sandbox.docker_host", sandbox.docker_host);
  sandbox.docker_binary = doc.string_or("sandbox.docker_binary", sandbox.docker_binary);
  sandbox.max_execution_time_secs = toml_unsigned<std::uint64_t>(
      doc, "sandbox.max_execution_time", sandbox.max_execution_time_secs);
  sandbox.keep_template = doc.bool_or("sandbox.keep_template", sandbox.keep_template);
  sandbox.helper_image = doc.string_or("sandbox.helper_image", sandbox.helper_image);
  sandbox.default_archive_root =
      doc.string_or("sandbox.default_archive_root", sandbox.default_archive_root);
  sandbox.start_retries =
      toml_unsigned<std::uint32_t>(doc, "sandbox.start_retries", sandbox.start_retries);
  sandbox.start_retry_interval_ms = toml_unsigned<std::uint64_t>(
      doc, "sandbox.start_retry_interval_ms", sandbox.start_retry_interval_ms);
  sandbox.session_idle_timeout_secs = toml_unsigned<std::uint64_t>(
      doc, "sandbox.session_idle_timeout", sandbox.session_idle_timeout_secs);
  sandbox.default_memory_bytes =
      toml_unsigned<std::uint64_t>(doc, "sandbox.memory_bytes", sandbox.default_memory_bytes);
  sandbox.default_cpu_shares =
      toml_unsigned<std::uint64_t>(doc, "sandbox.cpu_shares", sandbox.default_cpu_shares);
  sandbox.default_network_enabled =
      doc.bool_or("sandbox.network_enabled", sandbox.default_network_enabled);

  config.observability.backend =
      doc.string_or("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.string_or("observability.log_level", config.observability.log_level);

  config.error_tracking.sentry_dsn =
      doc.string_or("error_tracking.sentry_dsn", config.error_tracking.sentry_dsn);
  config.error_tracking.traces_sample_rate = doc.double_or(
      "error_tracking.traces_sample_rate", config.error_tracking.traces_sample_rate);

  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (auto value = env_value("RUNBOX_API_KEY"); value.has_value()) {
    config.server.api_key = *value;
  }
  if (auto value = env_value("RUNBOX_ENVIRONMENT"); value.has_value()) {
    config.environment = common::to_lower(*value);
  }
  if (auto value = env_value("RUNBOX_HOST"); value.has_value()) {
    config.server.host = *value;
  }
  env_unsigned("RUNBOX_PORT", config.server.port);
  if (auto value = env_value("RUNBOX_API_PREFIX"); value.has_value()) {
    config.server.api_prefix = *value;
  }
  env_unsigned("RUNBOX_WORKERS", config.server.workers);

  if (auto value = env_value("RUNBOX_RUNTIME"); value.has_value()) {
    config.sandbox.runtime = common::to_lower(*value);
  }
  if (auto value = env_value("RUNBOX_DOCKER_HOST"); value.has_value()) {
    config.sandbox.docker_host = *value;
  }
  env_unsigned("RUNBOX_MAX_EXECUTION_TIME", config.sandbox.max_execution_time_secs);
  env_bool("RUNBOX_KEEP_TEMPLATE", config.sandbox.keep_template);
  env_bool("RUNBOX_NETWORK_ENABLED", config.sandbox.default_network_enabled);
  if (auto value = env_value("RUNBOX_HELPER_IMAGE"); value.has_value()) {
    config.sandbox.helper_image = *value;
  }
  env_unsigned("RUNBOX_SESSION_IDLE_TIMEOUT", config.sandbox.session_idle_timeout_secs);

  if (auto value = env_value("RUNBOX_LOG_LEVEL"); value.has_value()) {
    config.observability.log_level = common::to_lower(*value);
  }
  if (auto value = env_value("RUNBOX_SENTRY_DSN"); value.has_value()) {
    config.error_tracking.sentry_dsn = *value;
  }
  if (auto value = env_value("RUNBOX_SENTRY_TRACES_SAMPLE_RATE"); value.has_value()) {
    char *end = nullptr;
    const double rate = std::strtod(value->c_str(), &end);
    if (end != nullptr && *end == '\0') {
      config.error_tracking.traces_sample_rate = rate;
    }
  }
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::propagate(cfg_path_result);
  }

  Config config;
  std::error_code ec;
  if (std::filesystem::exists(cfg_path_result.value(), ec)) {
    auto text = common::read_file(cfg_path_result.value());
    if (!text.ok()) {
      return common::Result<Config>::propagate(text);
    }
    auto parsed = parse_config(text.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(
          parsed.code(), cfg_path_result.value().string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.environment != "local" && config.environment != "staging" &&
      config.environment != "production") {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "environment must be local, staging or production: " +
                                         config.environment);
  }
  if (config.sandbox.runtime != "runc" && config.sandbox.runtime != "runsc") {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "sandbox.runtime must be runc or runsc: " +
                                         config.sandbox.runtime);
  }
  if (config.server.port == 0) {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "server.port must be non-zero");
  }
  if (config.sandbox.max_execution_time_secs == 0) {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "sandbox.max_execution_time must be positive");
  }
  if (config.server.workers == 0) {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "server.workers must be positive");
  }
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "log" && backend != "none" && backend != "noop") {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "observability.backend must be log or none");
  }
  const auto &level = config.observability.log_level;
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "observability.log_level must be debug, info, warn or error");
  }
  if (config.error_tracking.traces_sample_rate < 0.0 ||
      config.error_tracking.traces_sample_rate > 1.0) {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "error_tracking.traces_sample_rate must be within [0, 1]");
  }
  if (!config.server.api_prefix.empty() && config.server.api_prefix.front() != '/') {
    return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                     "server.api_prefix must start with '/'");
  }

  if (config.server.api_key.empty()) {
    if (config.environment != "local") {
      return ValidationResult::failure(common::ErrorCode::InvalidArgument,
                                       "server.api_key is required outside the local environment");
    }
    warnings.push_back("server.api_key is empty; API key checks are disabled");
  }
  if (!config.error_tracking.sentry_dsn.empty()) {
    warnings.push_back("error_tracking.sentry_dsn is set but no error tracking backend is built in");
  }
  if (config.sandbox.session_idle_timeout_secs == 0) {
    warnings.push_back("sandbox.session_idle_timeout is 0; idle sessions are never reaped");
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace runbox::config
