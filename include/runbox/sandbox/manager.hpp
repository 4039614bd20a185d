#pragma once

#include "runbox/common/result.hpp"
#include "runbox/config/schema.hpp"
#include "runbox/runtime/client.hpp"
#include "runbox/sandbox/session.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace runbox::sandbox {

struct ManagerOptions {
  std::string runtime = "runc";
  /// Cumulative command budget per session.
  std::chrono::milliseconds max_execution_time{600'000};
  bool keep_template = false;
  std::string helper_image = "alpine:3.20";
  std::string default_archive_root = "/workspace";
  std::string helper_mount = "/snapshot";
  /// HOME and XDG base directories for commands, outside the archive root.
  std::string sandbox_home = "/tmp/runbox-home";
  std::uint32_t start_retries = 20;
  std::chrono::milliseconds start_retry_interval{250};

  [[nodiscard]] static ManagerOptions from_config(const config::Config &config);
};

/// Owns every live session. Calls on different sessions run in parallel; calls on the same
/// session are serialized on its lane.
class SessionManager {
public:
  explicit SessionManager(std::shared_ptr<runtime::IRuntimeClient> client,
                          ManagerOptions options = {});
  ~SessionManager();

  SessionManager(const SessionManager &) = delete;
  SessionManager &operator=(const SessionManager &) = delete;

  [[nodiscard]] common::Result<std::string> open(const SessionOptions &options);
  [[nodiscard]] common::Result<RunOutcome> run(const std::string &session_id,
                                               const RunRequest &request);
  /// Idempotent; unknown ids succeed.
  [[nodiscard]] common::Status close(const std::string &session_id);
  [[nodiscard]] bool ping();

  /// Closes ready sessions unused for `max_idle` and drops dead tombstones. Returns the count.
  std::size_t close_idle(std::chrono::milliseconds max_idle);
  void close_all();

  [[nodiscard]] std::size_t active_sessions() const;
  [[nodiscard]] std::optional<SessionState> state(const std::string &session_id) const;
  [[nodiscard]] const ManagerOptions &options() const { return options_; }

private:
  [[nodiscard]] std::shared_ptr<Session> find(const std::string &session_id) const;
  void erase(const std::string &session_id, const std::shared_ptr<Session> &session);
  [[nodiscard]] common::Status provision(Session &session);
  [[nodiscard]] common::Status ensure_image(Session &session);
  [[nodiscard]] common::Status wait_until_running(const std::string &container);
  [[nodiscard]] common::Status prepare_root(Session &session, const archive::Archive &files,
                                            const std::string &workdir);
  common::Result<RunOutcome> execute(Session &session, const RunRequest &request,
                                     const archive::Archive &files, const std::string &workdir,
                                     const std::string &relative_workdir);
  /// Best-effort release of every resource; failures are logged.
  void release(Session &session, const std::string &reason, SessionState final_state);
  void publish_active_sessions() const;

  std::shared_ptr<runtime::IRuntimeClient> client_;
  ManagerOptions options_;
  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

/// "" or "." -> ""; rejects absolute paths and "..".
[[nodiscard]] common::Result<std::string> normalize_workdir(const std::optional<std::string> &workdir);

} // namespace runbox::sandbox
