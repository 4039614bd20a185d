#include "runbox/sandbox/manager.hpp"

#include "runbox/archive/diff.hpp"
#include "runbox/common/crypto.hpp"
#include "runbox/common/fs.hpp"
#include "runbox/observability/global.hpp"
#include "runbox/sandbox/executor.hpp"

#include <algorithm>
#include <cctype>
#include <thread>
#include <vector>

namespace runbox::sandbox {

namespace {

using common::ErrorCode;
constexpr const char *kComponent = "sessions";
constexpr std::size_t kMaxSessionIdLength = 64;

bool valid_session_id(const std::string &id) {
  if (id.empty() || id.size() > kMaxSessionIdLength) {
    return false;
  }
  for (const char ch : id) {
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '-' && ch != '_' && ch != '.') {
      return false;
    }
  }
  return std::isalnum(static_cast<unsigned char>(id.front())) != 0;
}

bool is_live(const SessionState state) {
  return state != SessionState::Closed && state != SessionState::Failed;
}

std::string join_path(const std::string &root, const std::string &relative) {
  if (relative.empty()) {
    return root;
  }
  if (root == "/") {
    return "/" + relative;
  }
  return root + "/" + relative;
}

std::string resolve_root(const runtime::ImageInfo &info, const std::string &fallback) {
  std::string root = common::trim(info.working_dir);
  while (root.size() > 1 && root.back() == '/') {
    root.pop_back();
  }
  if (root.empty() || root == "/") {
    return fallback;
  }
  return root;
}

void log_cleanup(const common::Status &status) {
  if (!status.ok()) {
    observability::log_warn(kComponent, "cleanup: " + status.error());
  }
}

std::string seconds_text(const std::chrono::milliseconds duration) {
  return std::to_string(duration.count() / 1000) + "s";
}

} // namespace

std::string_view session_state_name(const SessionState state) {
  switch (state) {
  case SessionState::Uninitialized:
    return "uninitialized";
  case SessionState::Opening:
    return "opening";
  case SessionState::Ready:
    return "ready";
  case SessionState::Executing:
    return "executing";
  case SessionState::Closing:
    return "closing";
  case SessionState::Closed:
    return "closed";
  case SessionState::Failed:
    return "failed";
  }
  return "failed";
}

common::Result<std::string> normalize_workdir(const std::optional<std::string> &workdir) {
  if (!workdir.has_value()) {
    return common::Result<std::string>::success("");
  }
  const std::string raw = common::trim(*workdir);
  if (!raw.empty() && raw.front() == '/') {
    return common::Result<std::string>::failure(ErrorCode::InvalidArgument,
                                                "workdir must be relative to the archive root: " +
                                                    raw);
  }
  std::vector<std::string> parts;
  for (auto &part : common::split(raw, '/')) {
    if (part.empty() || part == ".") {
      continue;
    }
    if (part == "..") {
      return common::Result<std::string>::failure(ErrorCode::InvalidArgument,
                                                  "workdir escapes the archive root: " + raw);
    }
    parts.push_back(std::move(part));
  }
  return common::Result<std::string>::success(common::join(parts, "/"));
}

ManagerOptions ManagerOptions::from_config(const config::Config &config) {
  ManagerOptions options;
  options.runtime = config.sandbox.runtime;
  options.max_execution_time =
      std::chrono::milliseconds(config.sandbox.max_execution_time_secs * 1000ULL);
  options.keep_template = config.sandbox.keep_template;
  options.helper_image = config.sandbox.helper_image;
  options.default_archive_root = config.sandbox.default_archive_root;
  options.start_retries = config.sandbox.start_retries;
  options.start_retry_interval =
      std::chrono::milliseconds(config.sandbox.start_retry_interval_ms);
  return options;
}

SessionManager::SessionManager(std::shared_ptr<runtime::IRuntimeClient> client,
                               ManagerOptions options)
    : client_(std::move(client)), options_(std::move(options)) {}

SessionManager::~SessionManager() { close_all(); }

std::shared_ptr<Session> SessionManager::find(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  const auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

void SessionManager::erase(const std::string &session_id, const std::shared_ptr<Session> &session) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  const auto it = sessions_.find(session_id);
  if (it != sessions_.end() && it->second == session) {
    sessions_.erase(it);
  }
}

common::Result<std::string> SessionManager::open(const SessionOptions &options) {
  const std::string id = options.session_id.value_or(common::random_hex(16));
  if (!valid_session_id(id)) {
    return common::Result<std::string>::failure(ErrorCode::InvalidArgument,
                                                "invalid session id: " + id);
  }
  if (common::trim(options.base_image).empty()) {
    return common::Result<std::string>::failure(ErrorCode::InvalidArgument,
                                                "base_image is required");
  }

  auto session = std::make_shared<Session>();
  session->id = id;
  session->base_image = common::trim(options.base_image);
  session->limits = options.limits;
  session->ephemeral = options.ephemeral;
  session->extract_patch = options.extract_patch;
  session->keep_image = options.keep_image.value_or(options_.keep_template);
  session->created_at = std::chrono::system_clock::now();
  session->last_used = std::chrono::steady_clock::now();
  session->state = SessionState::Opening;

  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    const auto existing = sessions_.find(id);
    if (existing != sessions_.end() && is_live(existing->second->state)) {
      return common::Result<std::string>::failure(ErrorCode::SessionExists,
                                                  "session already exists: " + id);
    }
    sessions_[id] = session;
  }

  std::lock_guard<std::mutex> lane(session->lane);
  const auto started = std::chrono::steady_clock::now();
  if (auto provisioned = provision(*session); !provisioned.ok()) {
    release(*session, "open failed", SessionState::Failed);
    erase(id, session);
    observability::record_error(kComponent, "open " + id + ": " + provisioned.error());
    return common::Result<std::string>::failure(provisioned);
  }

  session->state = SessionState::Ready;
  session->last_used = std::chrono::steady_clock::now();
  observability::record_event(observability::SessionOpenedEvent{
      .session_id = id,
      .image = session->base_image,
      .extract_patch = session->extract_patch,
      .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          session->last_used - started)});
  publish_active_sessions();
  return common::Result<std::string>::success(id);
}

common::Status SessionManager::ensure_image(Session &session) {
  auto exists = client_->image_exists(session.base_image);
  if (!exists.ok()) {
    return exists.status();
  }
  if (!exists.value()) {
    observability::log_info(kComponent, "pulling image " + session.base_image);
    if (auto pulled = client_->pull_image(session.base_image); !pulled.ok()) {
      return pulled;
    }
    session.image_pulled = true;
  }
  return common::Status::success();
}

common::Status SessionManager::wait_until_running(const std::string &container) {
  for (std::uint32_t attempt = 0; attempt <= options_.start_retries; ++attempt) {
    auto running = client_->is_running(container);
    if (!running.ok()) {
      return common::Status::error(ErrorCode::ContainerStart, running.error());
    }
    if (running.value()) {
      return common::Status::success();
    }
    if (attempt < options_.start_retries) {
      std::this_thread::sleep_for(options_.start_retry_interval);
    }
  }
  return common::Status::error(ErrorCode::ContainerStart,
                               "container " + container + " did not reach the running state");
}

common::Status SessionManager::provision(Session &session) {
  if (auto image = ensure_image(session); !image.ok()) {
    return image;
  }
  auto info = client_->inspect_image(session.base_image);
  if (!info.ok()) {
    return info.status();
  }
  session.archive_root = resolve_root(info.value(), options_.default_archive_root);
  session.image_user = common::trim(info.value().user);

  std::vector<runtime::VolumeMount> mounts;
  if (session.extract_patch) {
    auto helper_present = client_->image_exists(options_.helper_image);
    if (!helper_present.ok()) {
      return helper_present.status();
    }
    if (!helper_present.value()) {
      if (auto pulled = client_->pull_image(options_.helper_image); !pulled.ok()) {
        return pulled;
      }
    }
    const std::string volume = "runbox-" + session.id;
    if (auto created = client_->create_volume(volume); !created.ok()) {
      return created;
    }
    session.volume = volume;
    mounts.push_back(runtime::VolumeMount{.volume = volume, .target = session.archive_root});
  }

  const std::vector<std::pair<std::string, std::string>> labels = {
      {"runbox.session", session.id}};
  auto primary = client_->create_container(runtime::ContainerSpec{
      .name = "runbox-" + session.id,
      .image = session.base_image,
      .runtime = options_.runtime,
      .labels = labels,
      .memory_bytes = session.limits.memory_bytes,
      .cpu_shares = session.limits.cpu_shares,
      .network_enabled = session.limits.network_enabled,
      .mounts = mounts,
      .entrypoint = "/bin/sh",
      .command = {"-c", "tail -f /dev/null"}});
  if (!primary.ok()) {
    return primary.status();
  }
  session.primary_container = primary.value();
  if (auto started = client_->start_container(session.primary_container); !started.ok()) {
    return started;
  }
  if (auto running = wait_until_running(session.primary_container); !running.ok()) {
    return running;
  }

  if (session.extract_patch) {
    auto helper = client_->create_container(runtime::ContainerSpec{
        .name = "runbox-" + session.id + "-helper",
        .image = options_.helper_image,
        .runtime = options_.runtime,
        .labels = labels,
        .network_enabled = false,
        .mounts = {runtime::VolumeMount{
            .volume = *session.volume, .target = options_.helper_mount, .read_only = true}},
        .entrypoint = "/bin/sh",
        .command = {"-c", "tail -f /dev/null"}});
    if (!helper.ok()) {
      return helper.status();
    }
    session.helper_container = helper.value();
    if (auto started = client_->start_container(*session.helper_container); !started.ok()) {
      return started;
    }
    if (auto running = wait_until_running(*session.helper_container); !running.ok()) {
      return running;
    }
  }
  return common::Status::success();
}

common::Result<RunOutcome> SessionManager::run(const std::string &session_id,
                                               const RunRequest &request) {
  auto session = find(session_id);
  if (session == nullptr) {
    return common::Result<RunOutcome>::failure(ErrorCode::SessionNotFound,
                                               "session not found: " + session_id);
  }

  std::lock_guard<std::mutex> lane(session->lane);
  const SessionState state = session->state;
  if (state != SessionState::Ready) {
    return common::Result<RunOutcome>::failure(ErrorCode::SessionNotReady,
                                               "session " + session_id + " is " +
                                                   std::string(session_state_name(state)));
  }

  archive::Archive files;
  if (request.archive.has_value()) {
    files = *request.archive;
  } else {
    auto decoded = archive::decode(request.archive_base64);
    if (!decoded.ok()) {
      return common::Result<RunOutcome>::propagate(decoded);
    }
    files = std::move(decoded.value());
  }

  auto relative = normalize_workdir(request.workdir);
  if (!relative.ok()) {
    return common::Result<RunOutcome>::propagate(relative);
  }

  session->state = SessionState::Executing;
  auto outcome = execute(*session, request, files, join_path(session->archive_root, relative.value()),
                         relative.value().empty() ? "." : relative.value());
  if (!outcome.ok()) {
    const bool timed_out = outcome.code() == ErrorCode::ExecutionTimeout;
    observability::record_error(kComponent, "run " + session_id + ": " + outcome.error());
    release(*session, timed_out ? "timeout" : "runtime failure",
            timed_out ? SessionState::Closed : SessionState::Failed);
    publish_active_sessions();
    return outcome;
  }

  session->state = SessionState::Ready;
  session->last_used = std::chrono::steady_clock::now();
  return outcome;
}

common::Status SessionManager::prepare_root(Session &session, const archive::Archive &files,
                                            const std::string &workdir) {
  const auto setup = [&](std::vector<std::string> argv) -> common::Status {
    const std::string name = argv.front();
    auto ran = client_->exec(session.primary_container,
                             runtime::ExecRequest{.argv = std::move(argv),
                                                  .workdir = "/",
                                                  .user = "root",
                                                  .merge_output = true});
    if (!ran.ok()) {
      return ran.status();
    }
    if (ran.value().exit_code != 0 || ran.value().timed_out) {
      return common::Status::error(ErrorCode::RuntimeUnavailable,
                                   name + " failed in " + session.id + ": " +
                                       common::trim(ran.value().output));
    }
    return common::Status::success();
  };

  if (auto made = setup({"mkdir", "-p", session.archive_root}); !made.ok()) {
    return made;
  }
  std::vector<std::string> home_dirs = {"mkdir", "-p"};
  for (const auto &[name, dir] : sandbox_environment(options_.sandbox_home)) {
    home_dirs.push_back(dir);
  }
  if (auto made = setup(std::move(home_dirs)); !made.ok()) {
    return made;
  }
  if (!session.image_user.empty()) {
    if (auto owned = setup({"chown", "-R", session.image_user, options_.sandbox_home});
        !owned.ok()) {
      return owned;
    }
  }

  if (session.ephemeral) {
    if (auto cleared = setup({"find", session.archive_root, "-mindepth", "1", "-delete"});
        !cleared.ok()) {
      return cleared;
    }
  }

  if (!files.empty()) {
    // One second in the past so anything a command writes compares newer.
    const auto stamp = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count() -
                       1;
    archive::Archive stamped = files;
    for (auto &entry : stamped.entries) {
      entry.mtime = stamp;
    }
    auto tar = archive::write_tar(stamped);
    if (!tar.ok()) {
      return tar.status();
    }
    if (auto copied = client_->copy_in(session.primary_container, session.archive_root, tar.value());
        !copied.ok()) {
      return copied;
    }
    if (!session.image_user.empty()) {
      if (auto owned = setup({"chown", "-R", session.image_user, session.archive_root});
          !owned.ok()) {
        observability::log_warn(kComponent, owned.error());
      }
    }
  }

  if (workdir != session.archive_root) {
    return setup({"mkdir", "-p", workdir});
  }
  return common::Status::success();
}

common::Result<RunOutcome> SessionManager::execute(Session &session, const RunRequest &request,
                                                   const archive::Archive &files,
                                                   const std::string &workdir,
                                                   const std::string &relative_workdir) {
  if (auto prepared = prepare_root(session, files, workdir); !prepared.ok()) {
    return common::Result<RunOutcome>::failure(ErrorCode::RuntimeUnavailable, prepared.error());
  }

  std::optional<ContainerScanner> scanner;
  SnapshotCapture capture;
  if (session.helper_container.has_value()) {
    scanner.emplace(*client_, *session.helper_container, options_.helper_mount);
    auto captured = scanner->capture();
    if (!captured.ok()) {
      return common::Result<RunOutcome>::failure(ErrorCode::RuntimeUnavailable, captured.error());
    }
    capture = std::move(captured.value());
  }

  CommandExecutor executor(*client_, sandbox_environment(options_.sandbox_home));
  RunOutcome outcome;
  for (const auto &command : request.commands) {
    const auto remaining = options_.max_execution_time - session.consumed;
    const auto deadline =
        std::chrono::steady_clock::now() + std::max(remaining, std::chrono::milliseconds(0));
    auto invocation =
        executor.execute(session.primary_container, command, workdir, deadline, &session.cancel);
    session.consumed += invocation.duration;

    observability::record_event(observability::CommandEvent{
        .session_id = session.id,
        .command = command,
        .exit_code = invocation.exit_code,
        .timed_out = invocation.outcome == CommandOutcome::TimedOut,
        .duration = invocation.duration});
    observability::record_metric(observability::CommandLatencyMetric{.latency = invocation.duration});

    if (invocation.outcome == CommandOutcome::TimedOut) {
      return common::Result<RunOutcome>::failure(
          ErrorCode::ExecutionTimeout,
          invocation.cancelled ? "session " + session.id + " was closed during execution"
                               : "command exceeded the execution budget of " +
                                     seconds_text(options_.max_execution_time) + ": " + command);
    }
    if (invocation.outcome == CommandOutcome::ExecutorError) {
      return common::Result<RunOutcome>::failure(ErrorCode::RuntimeUnavailable,
                                                 "failed to execute command: " + invocation.error);
    }

    outcome.results.push_back(CommandResult{.command = command,
                                            .output = std::move(invocation.output),
                                            .exit_code = invocation.exit_code,
                                            .workdir = relative_workdir});
    if (request.fail_fast && invocation.exit_code != 0) {
      break;
    }
  }

  if (scanner.has_value()) {
    auto listing = scanner->scan();
    if (!listing.ok()) {
      return common::Result<RunOutcome>::failure(ErrorCode::RuntimeUnavailable, listing.error());
    }
    outcome.changes = detect_changes(capture.snapshot, listing.value());
    if (!outcome.changes.empty()) {
      auto collected = scanner->collect(outcome.changes.changed);
      if (!collected.ok()) {
        return common::Result<RunOutcome>::failure(ErrorCode::RuntimeUnavailable,
                                                   collected.error());
      }
      outcome.changed_files = std::move(collected.value());
      std::string patch =
          archive::make_patch(capture.pre_image, outcome.changed_files, outcome.changes.all_paths());
      if (!patch.empty()) {
        outcome.patch = std::move(patch);
      }
    }
    observability::record_event(observability::PatchEvent{
        .session_id = session.id,
        .changed_files = outcome.changes.changed.size(),
        .removed_files = outcome.changes.removed.size(),
        .patch_bytes = outcome.patch.has_value() ? outcome.patch->size() : 0});
  }

  return common::Result<RunOutcome>::success(std::move(outcome));
}

void SessionManager::release(Session &session, const std::string &reason,
                             const SessionState final_state) {
  session.state = SessionState::Closing;
  if (session.helper_container.has_value()) {
    log_cleanup(client_->stop_container(*session.helper_container));
    log_cleanup(client_->remove_container(*session.helper_container));
    session.helper_container.reset();
  }
  if (!session.primary_container.empty()) {
    log_cleanup(client_->stop_container(session.primary_container));
    log_cleanup(client_->remove_container(session.primary_container));
    session.primary_container.clear();
  }
  if (session.volume.has_value()) {
    log_cleanup(client_->remove_volume(*session.volume));
    session.volume.reset();
  }
  if (session.image_pulled && !session.keep_image) {
    log_cleanup(client_->remove_image(session.base_image));
    session.image_pulled = false;
  }
  session.state = final_state;
  session.last_used = std::chrono::steady_clock::now();
  observability::record_event(
      observability::SessionClosedEvent{.session_id = session.id, .reason = reason});
}

common::Status SessionManager::close(const std::string &session_id) {
  auto session = find(session_id);
  if (session == nullptr) {
    return common::Status::success();
  }

  session->cancel.cancel();
  {
    std::lock_guard<std::mutex> lane(session->lane);
    if (is_live(session->state)) {
      release(*session, "closed", SessionState::Closed);
    }
  }
  erase(session_id, session);
  publish_active_sessions();
  return common::Status::success();
}

bool SessionManager::ping() { return client_->ping(); }

std::size_t SessionManager::close_idle(const std::chrono::milliseconds max_idle) {
  std::vector<std::pair<std::string, std::shared_ptr<Session>>> candidates;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    candidates.assign(sessions_.begin(), sessions_.end());
  }

  std::size_t closed = 0;
  const auto now = std::chrono::steady_clock::now();
  for (const auto &[id, session] : candidates) {
    std::unique_lock<std::mutex> lane(session->lane, std::try_to_lock);
    if (!lane.owns_lock() || now - session->last_used < max_idle) {
      continue;
    }
    const SessionState state = session->state;
    if (state == SessionState::Ready) {
      observability::log_info(kComponent, "closing idle session " + id);
      release(*session, "idle", SessionState::Closed);
      ++closed;
    } else if (is_live(state)) {
      continue;
    }
    lane.unlock();
    erase(id, session);
  }
  if (closed > 0) {
    publish_active_sessions();
  }
  return closed;
}

void SessionManager::close_all() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto &[id, session] : sessions_) {
      ids.push_back(id);
    }
  }
  for (const auto &id : ids) {
    log_cleanup(close(id));
  }
}

std::size_t SessionManager::active_sessions() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::size_t count = 0;
  for (const auto &[id, session] : sessions_) {
    if (is_live(session->state)) {
      ++count;
    }
  }
  return count;
}

std::optional<SessionState> SessionManager::state(const std::string &session_id) const {
  auto session = find(session_id);
  if (session == nullptr) {
    return std::nullopt;
  }
  return session->state.load();
}

void SessionManager::publish_active_sessions() const {
  observability::record_metric(observability::ActiveSessionsMetric{.count = active_sessions()});
}

} // namespace runbox::sandbox
