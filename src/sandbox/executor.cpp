#include "runbox/sandbox/executor.hpp"

namespace runbox::sandbox {

std::string_view command_outcome_name(const CommandOutcome outcome) {
  switch (outcome) {
  case CommandOutcome::Completed:
    return "completed";
  case CommandOutcome::TimedOut:
    return "timed_out";
  case CommandOutcome::ExecutorError:
    return "executor_error";
  }
  return "executor_error";
}

Environment sandbox_environment(const std::string &home) {
  return {{"HOME", home},
          {"XDG_CACHE_HOME", home + "/.cache"},
          {"XDG_CONFIG_HOME", home + "/.config"},
          {"XDG_STATE_HOME", home + "/.local/state"},
          {"XDG_DATA_HOME", home + "/.local/share"}};
}

CommandExecutor::CommandExecutor(runtime::IRuntimeClient &client, Environment env)
    : client_(client), env_(std::move(env)) {}

CommandInvocation CommandExecutor::execute(const std::string &container, const std::string &command,
                                           const std::string &workdir,
                                           const std::chrono::steady_clock::time_point deadline,
                                           const common::CancellationToken *cancel) {
  CommandInvocation invocation;
  invocation.command = command;
  invocation.workdir = workdir;
  invocation.started_at = std::chrono::system_clock::now();
  invocation.deadline = deadline;

  const auto started = std::chrono::steady_clock::now();
  if (cancel != nullptr && cancel->cancelled()) {
    invocation.outcome = CommandOutcome::TimedOut;
    invocation.cancelled = true;
    return invocation;
  }
  if (started >= deadline) {
    invocation.outcome = CommandOutcome::TimedOut;
    return invocation;
  }

  // The command travels as a single argv element; the shell does all parsing.
  auto ran = client_.exec(container, runtime::ExecRequest{.argv = {"/bin/sh", "-c", command},
                                                          .workdir = workdir,
                                                          .env = env_,
                                                          .merge_output = true,
                                                          .deadline = deadline,
                                                          .cancel = cancel});
  invocation.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (!ran.ok()) {
    invocation.outcome = CommandOutcome::ExecutorError;
    invocation.error = ran.error();
    return invocation;
  }

  auto &result = ran.value();
  invocation.output = std::move(result.output);
  if (result.timed_out || result.cancelled) {
    invocation.outcome = CommandOutcome::TimedOut;
    invocation.cancelled = result.cancelled;
    return invocation;
  }
  invocation.exit_code = result.exit_code;
  invocation.outcome = CommandOutcome::Completed;
  return invocation;
}

} // namespace runbox::sandbox
