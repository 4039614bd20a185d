#pragma once

#include "runbox/archive/archive.hpp"
#include "runbox/common/cancellation.hpp"
#include "runbox/sandbox/changes.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runbox::sandbox {

enum class SessionState { Uninitialized, Opening, Ready, Executing, Closing, Closed, Failed };

[[nodiscard]] std::string_view session_state_name(SessionState state);

struct ResourceLimits {
  std::uint64_t memory_bytes = 0;
  std::uint64_t cpu_shares = 0;
  bool network_enabled = false;
};

struct SessionOptions {
  std::optional<std::string> session_id;
  std::string base_image;
  ResourceLimits limits;
  /// Clear the archive root before every run.
  bool ephemeral = false;
  bool extract_patch = false;
  /// Unset follows the manager's keep_template setting.
  std::optional<bool> keep_image;
};

struct RunRequest {
  /// base64 tar(.gz); ignored when `archive` is set.
  std::string archive_base64;
  std::optional<archive::Archive> archive;
  std::vector<std::string> commands;
  bool fail_fast = false;
  std::optional<std::string> workdir;
};

struct CommandResult {
  std::string command;
  std::string output;
  int exit_code = 0;
  std::string workdir;
};

struct RunOutcome {
  std::vector<CommandResult> results;
  std::optional<std::string> patch;
  ChangeSet changes;
  /// Post-run content of the changed files.
  archive::Archive changed_files;
};

/// Live sandbox state; only the thread holding `lane` mutates it.
struct Session {
  std::string id;
  std::string base_image;
  std::string primary_container;
  std::optional<std::string> helper_container;
  std::optional<std::string> volume;
  std::string archive_root;
  std::string image_user;
  ResourceLimits limits;
  bool ephemeral = false;
  bool extract_patch = false;
  bool image_pulled = false;
  bool keep_image = false;
  std::chrono::system_clock::time_point created_at;
  std::chrono::steady_clock::time_point last_used;
  std::chrono::milliseconds consumed{0};

  std::atomic<SessionState> state{SessionState::Uninitialized};
  std::mutex lane;
  common::CancellationToken cancel;
};

} // namespace runbox::sandbox
