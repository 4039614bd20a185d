#pragma once

#include "runbox/common/cancellation.hpp"
#include "runbox/runtime/client.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace runbox::sandbox {

enum class CommandOutcome { Completed, TimedOut, ExecutorError };

[[nodiscard]] std::string_view command_outcome_name(CommandOutcome outcome);

struct CommandInvocation {
  std::string command;
  std::string workdir;
  std::chrono::system_clock::time_point started_at;
  std::chrono::steady_clock::time_point deadline;
  std::chrono::milliseconds duration{0};
  int exit_code = -1;
  /// stdout and stderr interleaved as produced.
  std::string output;
  CommandOutcome outcome = CommandOutcome::ExecutorError;
  bool cancelled = false;
  std::string error;
};

using Environment = std::vector<std::pair<std::string, std::string>>;

/// HOME plus the XDG cache, config, state and data directories, all under `home`.
[[nodiscard]] Environment sandbox_environment(const std::string &home);

/// Runs one shell command in a container under an absolute deadline.
class CommandExecutor {
public:
  explicit CommandExecutor(runtime::IRuntimeClient &client, Environment env = {});

  [[nodiscard]] CommandInvocation execute(const std::string &container, const std::string &command,
                                          const std::string &workdir,
                                          std::chrono::steady_clock::time_point deadline,
                                          const common::CancellationToken *cancel = nullptr);

private:
  runtime::IRuntimeClient &client_;
  Environment env_;
};

} // namespace runbox::sandbox
