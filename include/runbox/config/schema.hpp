#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace runbox::config {

struct ServerConfig {
  std::string host = "0.0.0.0";
  std::uint16_t port = 8000;
  std::string api_prefix = "/api/v1";
  std::string api_key;
  std::size_t max_body_bytes = 64ULL * 1024ULL * 1024ULL;
  std::size_t workers = 8;
};

struct SandboxConfig {
  /// OCI runtime handed to the engine: runc or runsc (gVisor).
  std::string runtime = "runc";
  std::string docker_host;
  std::string docker_binary = "docker";
  std::uint64_t max_execution_time_secs = 600;
  bool keep_template = false;
  std::string helper_image = "alpine:3.20";
  std::string default_archive_root = "/workspace";
  std::uint32_t start_retries = 20;
  std::uint64_t start_retry_interval_ms = 250;
  std::uint64_t session_idle_timeout_secs = 1800;
  std::uint64_t default_memory_bytes = 0;
  std::uint64_t default_cpu_shares = 0;
  /// Applied when a request does not say whether the session may reach the network.
  bool default_network_enabled = true;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string log_level = "info";
};

struct ErrorTrackingConfig {
  std::string sentry_dsn;
  double traces_sample_rate = 0.0;
};

struct Config {
  std::string environment = "local";
  ServerConfig server;
  SandboxConfig sandbox;
  ObservabilityConfig observability;
  ErrorTrackingConfig error_tracking;
};

} // namespace runbox::config
