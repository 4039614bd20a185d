#include "test_framework.hpp"
#include "tests/helpers/local_runtime.hpp"

#include "runbox/sandbox/executor.hpp"

namespace {

std::string start_container(runbox::testing::LocalRuntimeClient &client) {
  auto id = client.create_container(runbox::runtime::ContainerSpec{.name = "exec-target",
                                                                   .image = "alpine:3.20"});
  if (!id.ok() || !client.start_container(id.value()).ok()) {
    throw std::runtime_error("container setup failed");
  }
  return id.value();
}

std::chrono::steady_clock::time_point in(std::chrono::milliseconds delay) {
  return std::chrono::steady_clock::now() + delay;
}

} // namespace

void register_executor_tests(std::vector<runbox::tests::TestCase> &tests) {
  using runbox::tests::require;
  namespace sandbox = runbox::sandbox;
  using namespace std::chrono_literals;

  tests.push_back({"executor_runs_shell_command", [] {
                     runbox::testing::LocalRuntimeClient client;
                     const auto container = start_container(client);
                     sandbox::CommandExecutor executor(client);
                     const auto invocation =
                         executor.execute(container, "echo out; echo err >&2; exit 4", "/", in(10s));
                     require(invocation.outcome == sandbox::CommandOutcome::Completed,
                             "completed: " + invocation.error);
                     require(invocation.exit_code == 4, "exit code kept");
                     require(invocation.output == "out\nerr\n", "merged output: " + invocation.output);
                     require(invocation.command == "echo out; echo err >&2; exit 4", "command kept");
                   }});

  tests.push_back({"executor_shell_features_work", [] {
                     runbox::testing::LocalRuntimeClient client;
                     const auto container = start_container(client);
                     sandbox::CommandExecutor executor(client);
                     const auto invocation = executor.execute(
                         container, "X='a b'; echo \"$X\" | tr a-z A-Z && false || echo fallback",
                         "/", in(10s));
                     require(invocation.output == "A B\nfallback\n", "pipes and operators: " +
                                                                        invocation.output);
                     require(invocation.exit_code == 0, "last command wins");
                   }});

  tests.push_back({"executor_passes_environment", [] {
                     runbox::testing::LocalRuntimeClient client;
                     const auto container = start_container(client);
                     sandbox::CommandExecutor executor(client, {{"GREETING", "hello"}});
                     const auto invocation = executor.execute(container, "echo \"$GREETING\"", "/",
                                                              in(10s));
                     require(invocation.output == "hello\n", "env var: " + invocation.output);
                   }});

  tests.push_back({"executor_deadline_interrupts_command", [] {
                     runbox::testing::LocalRuntimeClient client;
                     const auto container = start_container(client);
                     sandbox::CommandExecutor executor(client);
                     const auto invocation = executor.execute(container, "sleep 30", "/", in(200ms));
                     require(invocation.outcome == sandbox::CommandOutcome::TimedOut, "timed out");
                     require(!invocation.cancelled, "not a cancellation");
                     require(invocation.duration < 10s, "returned promptly");
                   }});

  tests.push_back({"executor_expired_deadline_skips_exec", [] {
                     runbox::testing::LocalRuntimeClient client;
                     const auto container = start_container(client);
                     sandbox::CommandExecutor executor(client);
                     const auto invocation =
                         executor.execute(container, "touch should-not-exist", "/",
                                          std::chrono::steady_clock::now() - 1ms);
                     require(invocation.outcome == sandbox::CommandOutcome::TimedOut, "timed out");
                     require(!std::filesystem::exists(client.host_path(container, "/should-not-exist")),
                             "command never ran");
                   }});

  tests.push_back({"executor_cancelled_token", [] {
                     runbox::testing::LocalRuntimeClient client;
                     const auto container = start_container(client);
                     sandbox::CommandExecutor executor(client);
                     runbox::common::CancellationToken token;
                     token.cancel();
                     const auto invocation = executor.execute(container, "true", "/", in(10s), &token);
                     require(invocation.outcome == sandbox::CommandOutcome::TimedOut &&
                                 invocation.cancelled,
                             "cancelled before start");
                   }});

  tests.push_back({"executor_reports_runtime_errors", [] {
                     runbox::testing::LocalRuntimeClient client;
                     sandbox::CommandExecutor executor(client);
                     const auto invocation = executor.execute("missing", "true", "/", in(10s));
                     require(invocation.outcome == sandbox::CommandOutcome::ExecutorError,
                             "executor error");
                     require(!invocation.error.empty(), "error message kept");
                     require(sandbox::command_outcome_name(invocation.outcome) == "executor_error",
                             "outcome name");
                   }});
}
