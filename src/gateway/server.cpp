#include "runbox/gateway/server.hpp"

#include "runbox/archive/archive.hpp"
#include "runbox/common/crypto.hpp"
#include "runbox/common/fs.hpp"
#include "runbox/common/json_util.hpp"
#include "runbox/common/version.hpp"
#include "runbox/languages/runner.hpp"
#include "runbox/observability/global.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <sstream>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace runbox::gateway {

namespace {

using common::ErrorCode;

constexpr int kListenBacklog = 64;
constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
constexpr const char *kApiKeyHeader = "x-api-key";
constexpr const char *kComponent = "gateway";

std::string header_lookup(const HttpRequest &request, const std::string &key) {
  auto it = request.headers.find(common::to_lower(key));
  if (it == request.headers.end()) {
    return "";
  }
  return it->second;
}

std::string status_text(const int status) {
  switch (status) {
  case 200:
    return "OK";
  case 204:
    return "No Content";
  case 400:
    return "Bad Request";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 409:
    return "Conflict";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  case 504:
    return "Gateway Timeout";
  default:
    return "OK";
  }
}

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> out;
  for (const auto &part : common::split(query, '&')) {
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      out[part] = "";
      continue;
    }
    out[part.substr(0, eq)] = part.substr(eq + 1);
  }
  return out;
}

HttpResponse make_json_response(const int status, const std::string &body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body;
  return response;
}

HttpResponse detail_response(const int status, const std::string &detail) {
  return make_json_response(status, "{\"detail\":" + common::json_quote(detail) + "}");
}

std::string optional_json(const std::optional<std::string> &value) {
  return value.has_value() ? common::json_quote(*value) : "null";
}

std::string results_json(const std::vector<sandbox::CommandResult> &results) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "{\"command\":" << common::json_quote(results[i].command)
        << ",\"output\":" << common::json_quote(results[i].output)
        << ",\"exit_code\":" << results[i].exit_code
        << ",\"workdir\":" << common::json_quote(results[i].workdir) << "}";
  }
  out << "]";
  return out.str();
}

/// Typed access to the members of a JSON request body; the first problem is kept.
class BodyReader {
public:
  explicit BodyReader(const common::JsonObject &body) : body_(body) {}

  std::optional<std::string> string(const std::string &key, const bool required = false) {
    const std::string *raw = lookup(key, required);
    if (raw == nullptr) {
      return std::nullopt;
    }
    auto value = common::json_as_string(*raw);
    if (!value.has_value()) {
      fail("field '" + key + "' must be a string");
    }
    return value;
  }

  std::optional<bool> boolean(const std::string &key) {
    const std::string *raw = lookup(key, false);
    if (raw == nullptr) {
      return std::nullopt;
    }
    auto value = common::json_as_bool(*raw);
    if (!value.has_value()) {
      fail("field '" + key + "' must be a boolean");
    }
    return value;
  }

  std::optional<std::uint64_t> count(const std::string &key) {
    const std::string *raw = lookup(key, false);
    if (raw == nullptr) {
      return std::nullopt;
    }
    auto value = common::json_as_int(*raw);
    if (!value.has_value() || *value < 0) {
      fail("field '" + key + "' must be a non-negative integer");
      return std::nullopt;
    }
    return static_cast<std::uint64_t>(*value);
  }

  std::optional<std::vector<std::string>> strings(const std::string &key,
                                                  const bool required = false) {
    const std::string *raw = lookup(key, required);
    if (raw == nullptr) {
      return std::nullopt;
    }
    auto value = common::json_as_string_array(*raw);
    if (!value.has_value()) {
      fail("field '" + key + "' must be an array of strings");
    }
    return value;
  }

  [[nodiscard]] bool ok() const { return error_.empty(); }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  const std::string *lookup(const std::string &key, const bool required) {
    auto it = body_.find(key);
    if (it == body_.end() || common::json_is_null(it->second)) {
      if (required) {
        fail("field '" + key + "' is required");
      }
      return nullptr;
    }
    return &it->second;
  }

  void fail(const std::string &message) {
    if (error_.empty()) {
      error_ = message;
    }
  }

  const common::JsonObject &body_;
  std::string error_;
};

common::Result<common::JsonObject> parse_body(const HttpRequest &request) {
  auto parsed = common::json_parse_object(common::trim(request.body));
  if (!parsed.ok()) {
    return common::Result<common::JsonObject>::failure(ErrorCode::InvalidArgument,
                                                       "invalid request body: " + parsed.error());
  }
  return parsed;
}

void send_all(const int fd, const std::string &text) {
  std::size_t sent = 0;
  while (sent < text.size()) {
    const ssize_t n = send(fd, text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return;
    }
    sent += static_cast<std::size_t>(n);
  }
}

void close_session(sandbox::SessionManager &manager, const std::string &session_id) {
  if (auto closed = manager.close(session_id); !closed.ok()) {
    observability::log_warn(kComponent, closed.error());
  }
}

} // namespace

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure(ErrorCode::InvalidArgument, "incomplete request");
  }

  const std::string headers_part = raw.substr(0, header_end);
  std::istringstream head_stream(headers_part);
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure(ErrorCode::InvalidArgument,
                                                "missing request line");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version)) {
    return common::Result<HttpRequest>::failure(ErrorCode::InvalidArgument,
                                                "invalid request line");
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const auto colon = line.find(':');
    if (line.empty() || colon == std::string::npos) {
      continue;
    }
    request.headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }

  request.body = raw.substr(header_end + 4);
  const auto qpos = request.raw_path.find('?');
  if (qpos == std::string::npos) {
    request.path = request.raw_path;
  } else {
    request.path = request.raw_path.substr(0, qpos);
    request.query = parse_query_string(request.raw_path.substr(qpos + 1));
  }
  return common::Result<HttpRequest>::success(std::move(request));
}

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  if (response.status != 204) {
    out << "Content-Type: " << response.content_type << "\r\n";
  }
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &[key, value] : response.headers) {
    out << key << ": " << value << "\r\n";
  }
  out << "\r\n";
  out << response.body;
  return out.str();
}

int http_status_for(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return 200;
  case ErrorCode::ArchiveFormat:
  case ErrorCode::InvalidArgument:
  case ErrorCode::UnsupportedLanguage:
  case ErrorCode::ImagePull:
    return 400;
  case ErrorCode::SessionNotFound:
    return 404;
  case ErrorCode::SessionNotReady:
  case ErrorCode::SessionExists:
    return 409;
  case ErrorCode::ExecutionTimeout:
    return 504;
  case ErrorCode::RuntimeUnavailable:
    return 503;
  case ErrorCode::ContainerStart:
  case ErrorCode::Internal:
    return 500;
  }
  return 500;
}

HttpResponse error_response(const common::Status &status) {
  return detail_response(http_status_for(status.code()), status.error());
}

GatewayServer::GatewayServer(const config::Config &config,
                             std::shared_ptr<sandbox::SessionManager> manager)
    : config_(config), manager_(std::move(manager)) {}

GatewayServer::~GatewayServer() { stop(); }

common::Status GatewayServer::start(const GatewayOptions &options) {
  if (running_) {
    return common::Status::error("gateway already running");
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  if (inet_pton(AF_INET, options.host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error(ErrorCode::InvalidArgument, "invalid bind host: " + options.host);
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("bind failed: " + msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  running_ = true;
  workers_.start(config_.server.workers);
  accept_thread_ = std::thread([this]() { accept_loop(); });
  if (options.session_idle_timeout.count() > 0) {
    reaper_thread_ = std::thread([this, options]() { reap_loop(options); });
  }
  observability::log_info(kComponent, "listening on " + options.host + ":" +
                                          std::to_string(bound_port_));
  return common::Status::success();
}

void GatewayServer::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (reaper_thread_.joinable()) {
    reaper_thread_.join();
  }
  workers_.stop();
}

std::uint16_t GatewayServer::port() const { return bound_port_; }

bool GatewayServer::is_running() const { return running_.load(); }

HttpResponse GatewayServer::dispatch(const HttpRequest &request) {
  const auto started = std::chrono::steady_clock::now();
  std::string label = request.method + " " + request.path;
  HttpResponse response = route(request, label);
  observability::record_metric(observability::RequestLatencyMetric{
      .route = label,
      .status = response.status,
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)});
  if (response.status >= 500) {
    observability::record_error(kComponent, label + " -> " + std::to_string(response.status));
  }
  return response;
}

HttpResponse GatewayServer::route(const HttpRequest &request, std::string &label) {
  std::string path = request.path;
  const std::string &prefix = config_.server.api_prefix;
  if (!prefix.empty() && prefix != "/" && common::starts_with(path, prefix) &&
      (path.size() == prefix.size() || path[prefix.size()] == '/')) {
    path = path.substr(prefix.size());
  }
  if (path.empty() || path.back() != '/') {
    path.push_back('/');
  }
  const std::string &method = request.method;
  label = method + " " + path;

  if (path == "/-/health/") {
    return method == "GET" ? handle_health() : detail_response(405, "Method Not Allowed");
  }
  if (path == "/-/version/") {
    return method == "GET" ? handle_version() : detail_response(405, "Method Not Allowed");
  }

  const bool known = path == "/run/commands/" || path == "/run/code/" ||
                     common::starts_with(path, "/session/");
  if (!known) {
    return detail_response(404, "Not Found");
  }
  if (auto denied = check_api_key(request); denied.has_value()) {
    return *denied;
  }

  if (path == "/run/commands/") {
    return method == "POST" ? handle_run_commands(request)
                            : detail_response(405, "Method Not Allowed");
  }
  if (path == "/run/code/") {
    return method == "POST" ? handle_run_code(request) : detail_response(405, "Method Not Allowed");
  }
  if (path == "/session/") {
    return method == "POST" ? handle_open_session(request)
                            : detail_response(405, "Method Not Allowed");
  }

  std::string session_id = path.substr(std::string("/session/").size());
  session_id.pop_back();
  if (session_id.empty() || session_id.find('/') != std::string::npos) {
    return detail_response(404, "Not Found");
  }
  label = method + " /session/{id}/";
  if (method == "POST") {
    return handle_run_session(session_id, request);
  }
  if (method == "DELETE") {
    return handle_close_session(session_id);
  }
  return detail_response(405, "Method Not Allowed");
}

std::optional<HttpResponse> GatewayServer::check_api_key(const HttpRequest &request) const {
  if (config_.server.api_key.empty()) {
    return std::nullopt;
  }
  if (request.headers.find(kApiKeyHeader) == request.headers.end()) {
    return detail_response(403, "API Key header is missing");
  }
  if (!common::constant_time_equals(header_lookup(request, kApiKeyHeader),
                                    config_.server.api_key)) {
    return detail_response(403, "Invalid API Key");
  }
  return std::nullopt;
}

sandbox::ResourceLimits GatewayServer::default_limits() const {
  return sandbox::ResourceLimits{.memory_bytes = config_.sandbox.default_memory_bytes,
                                 .cpu_shares = config_.sandbox.default_cpu_shares,
                                 .network_enabled = config_.sandbox.default_network_enabled};
}

HttpResponse GatewayServer::handle_health() const {
  if (!manager_->ping()) {
    return make_json_response(503, R"({"status":"unavailable"})");
  }
  return make_json_response(200, R"({"status":"ok"})");
}

HttpResponse GatewayServer::handle_version() const {
  return make_json_response(200, "{\"version\":" + common::json_quote(common::version()) + "}");
}

HttpResponse GatewayServer::handle_run_commands(const HttpRequest &request) {
  auto body = parse_body(request);
  if (!body.ok()) {
    return error_response(body.status());
  }
  BodyReader in(body.value());
  const auto run_id = in.string("run_id");
  const auto base_image = in.string("base_image", true);
  const auto archive = in.string("archive");
  const auto commands = in.strings("commands", true);
  const auto fail_fast = in.boolean("fail_fast");
  const auto workdir = in.string("workdir");
  const auto extract_patch = in.boolean("extract_patch");
  if (!in.ok()) {
    return detail_response(400, in.error());
  }

  auto session_id = manager_->open(sandbox::SessionOptions{.session_id = run_id,
                                                           .base_image = *base_image,
                                                           .limits = default_limits(),
                                                           .extract_patch =
                                                               extract_patch.value_or(true)});
  if (!session_id.ok()) {
    return error_response(session_id.status());
  }

  auto outcome = manager_->run(session_id.value(),
                               sandbox::RunRequest{.archive_base64 = archive.value_or(""),
                                                   .commands = *commands,
                                                   .fail_fast = fail_fast.value_or(false),
                                                   .workdir = workdir});
  close_session(*manager_, session_id.value());
  if (!outcome.ok()) {
    return error_response(outcome.status());
  }

  std::optional<std::string> changed_archive;
  if (!outcome.value().changed_files.empty()) {
    auto encoded = archive::encode(outcome.value().changed_files);
    if (!encoded.ok()) {
      return error_response(encoded.status());
    }
    changed_archive = std::move(encoded.value());
  }

  return make_json_response(200, "{\"results\":" + results_json(outcome.value().results) +
                                     ",\"patch\":" + optional_json(outcome.value().patch) +
                                     ",\"archive\":" + optional_json(changed_archive) + "}");
}

HttpResponse GatewayServer::handle_run_code(const HttpRequest &request) {
  auto body = parse_body(request);
  if (!body.ok()) {
    return error_response(body.status());
  }
  BodyReader in(body.value());
  const auto run_id = in.string("run_id");
  const auto language = in.string("language", true);
  const auto code = in.string("code", true);
  const auto dependencies = in.strings("dependencies");
  if (!in.ok()) {
    return detail_response(400, in.error());
  }

  auto result = languages::run_code(
      *manager_, languages::CodeRequest{.run_id = run_id,
                                        .language = *language,
                                        .code = *code,
                                        .dependencies = dependencies.value_or(
                                            std::vector<std::string>{})});
  if (!result.ok()) {
    return error_response(result.status());
  }
  if (result.value().exit_code != 0) {
    return detail_response(400, result.value().output);
  }
  return make_json_response(200, "{\"output\":" + common::json_quote(result.value().output) + "}");
}

HttpResponse GatewayServer::handle_open_session(const HttpRequest &request) {
  auto body = parse_body(request);
  if (!body.ok()) {
    return error_response(body.status());
  }
  BodyReader in(body.value());
  const auto session_id = in.string("session_id");
  const auto base_image = in.string("base_image", true);
  const auto extract_patch = in.boolean("extract_patch");
  const auto network_enabled = in.boolean("network_enabled");
  const auto memory_bytes = in.count("memory_bytes");
  const auto cpu_shares = in.count("cpu_shares");
  const auto ephemeral = in.boolean("ephemeral");
  const auto keep_image = in.boolean("keep_image");
  if (!in.ok()) {
    return detail_response(400, in.error());
  }

  sandbox::ResourceLimits limits = default_limits();
  limits.memory_bytes = memory_bytes.value_or(limits.memory_bytes);
  limits.cpu_shares = cpu_shares.value_or(limits.cpu_shares);
  limits.network_enabled = network_enabled.value_or(limits.network_enabled);

  auto opened = manager_->open(sandbox::SessionOptions{.session_id = session_id,
                                                       .base_image = *base_image,
                                                       .limits = limits,
                                                       .ephemeral = ephemeral.value_or(false),
                                                       .extract_patch =
                                                           extract_patch.value_or(false),
                                                       .keep_image = keep_image});
  if (!opened.ok()) {
    return error_response(opened.status());
  }
  return make_json_response(200, "{\"session_id\":" + common::json_quote(opened.value()) + "}");
}

HttpResponse GatewayServer::handle_run_session(const std::string &session_id,
                                               const HttpRequest &request) {
  auto body = parse_body(request);
  if (!body.ok()) {
    return error_response(body.status());
  }
  BodyReader in(body.value());
  const auto archive = in.string("archive");
  const auto commands = in.strings("commands", true);
  const auto fail_fast = in.boolean("fail_fast");
  const auto workdir = in.string("workdir");
  if (!in.ok()) {
    return detail_response(400, in.error());
  }

  auto outcome = manager_->run(session_id,
                               sandbox::RunRequest{.archive_base64 = archive.value_or(""),
                                                   .commands = *commands,
                                                   .fail_fast = fail_fast.value_or(false),
                                                   .workdir = workdir});
  if (!outcome.ok()) {
    return error_response(outcome.status());
  }
  return make_json_response(200, "{\"results\":" + results_json(outcome.value().results) +
                                     ",\"patch\":" + optional_json(outcome.value().patch) + "}");
}

HttpResponse GatewayServer::handle_close_session(const std::string &session_id) {
  if (auto closed = manager_->close(session_id); !closed.ok()) {
    return error_response(closed);
  }
  HttpResponse response;
  response.status = 204;
  return response;
}

void GatewayServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }
    const bool queued = workers_.submit([this, client]() {
      handle_client(client);
      close(client);
    });
    if (!queued) {
      close(client);
    }
  }
}

void GatewayServer::handle_client(const int client_fd) {
  timeval timeout{};
  timeout.tv_sec = 30;
  setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

  const std::size_t max_body = config_.server.max_body_bytes;
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t content_length = 0;
  std::size_t header_end = std::string::npos;
  while (true) {
    const ssize_t n = recv(client_fd, buf.data(), buf.size(), 0);
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    if (header_end == std::string::npos) {
      header_end = raw.find("\r\n\r\n");
      if (header_end == std::string::npos) {
        if (raw.size() > kMaxHeaderBytes) {
          send_all(client_fd, render_http_response(detail_response(400, "headers too large")));
          return;
        }
        continue;
      }
      auto head = parse_http_request(raw.substr(0, header_end + 4));
      if (head.ok()) {
        const auto declared = common::parse_int(header_lookup(head.value(), "content-length"));
        content_length = declared.has_value() && *declared > 0
                             ? static_cast<std::size_t>(*declared)
                             : 0;
      }
      if (content_length > max_body) {
        send_all(client_fd, render_http_response(detail_response(413, "request body too large")));
        return;
      }
    }

    if (raw.size() >= header_end + 4 + content_length) {
      break;
    }
  }

  auto parsed = parse_http_request(raw);
  const HttpResponse response =
      parsed.ok() ? dispatch(parsed.value()) : detail_response(400, "invalid request");
  send_all(client_fd, render_http_response(response));
}

void GatewayServer::reap_loop(const GatewayOptions options) {
  const auto max_idle = std::chrono::duration_cast<std::chrono::milliseconds>(
      options.session_idle_timeout);
  while (running_) {
    const auto wait_steps = std::max<long long>(1, options.reap_interval.count() / 100);
    for (long long i = 0; i < wait_steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (!running_) {
      break;
    }
    const std::size_t closed = manager_->close_idle(max_idle);
    if (closed > 0) {
      observability::log_info(kComponent, "reaped " + std::to_string(closed) + " idle sessions");
    }
  }
}

} // namespace runbox::gateway
