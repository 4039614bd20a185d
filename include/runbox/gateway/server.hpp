#pragma once

#include "runbox/common/result.hpp"
#include "runbox/config/schema.hpp"
#include "runbox/gateway/worker_pool.hpp"
#include "runbox/sandbox/manager.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace runbox::gateway {

struct GatewayOptions {
  std::string host = "0.0.0.0";
  std::uint16_t port = 8000;
  /// 0 disables the idle-session reaper.
  std::chrono::seconds session_idle_timeout{1800};
  std::chrono::milliseconds reap_interval{30'000};
};

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> query;
  std::string body;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);
[[nodiscard]] int http_status_for(common::ErrorCode code);
/// `{"detail": message}` with the status mapped from the error code.
[[nodiscard]] HttpResponse error_response(const common::Status &status);

class GatewayServer {
public:
  GatewayServer(const config::Config &config, std::shared_ptr<sandbox::SessionManager> manager);
  ~GatewayServer();

  GatewayServer(const GatewayServer &) = delete;
  GatewayServer &operator=(const GatewayServer &) = delete;

  [[nodiscard]] common::Status start(const GatewayOptions &options);
  void stop();

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] HttpResponse dispatch(const HttpRequest &request);

private:
  [[nodiscard]] HttpResponse route(const HttpRequest &request, std::string &label);
  [[nodiscard]] HttpResponse handle_health() const;
  [[nodiscard]] HttpResponse handle_version() const;
  [[nodiscard]] HttpResponse handle_run_commands(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_run_code(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_open_session(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_run_session(const std::string &session_id,
                                                const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_close_session(const std::string &session_id);

  [[nodiscard]] std::optional<HttpResponse> check_api_key(const HttpRequest &request) const;
  [[nodiscard]] sandbox::ResourceLimits default_limits() const;

  void accept_loop();
  void handle_client(int client_fd);
  void reap_loop(GatewayOptions options);

  const config::Config &config_;
  std::shared_ptr<sandbox::SessionManager> manager_;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::thread reaper_thread_;
  std::uint16_t bound_port_ = 0;
  WorkerPool workers_;
};

} // namespace runbox::gateway
