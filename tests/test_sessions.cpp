#include "test_framework.hpp"
#include "tests/helpers/local_runtime.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "runbox/archive/diff.hpp"
#include "runbox/common/fs.hpp"
#include "runbox/sandbox/executor.hpp"
#include "runbox/sandbox/manager.hpp"

#include <algorithm>
#include <thread>

namespace {

using runbox::common::ErrorCode;
namespace sandbox = runbox::sandbox;

constexpr const char *kImage = "python:3.12";

struct Fixture {
  std::shared_ptr<runbox::testing::LocalRuntimeClient> client =
      std::make_shared<runbox::testing::LocalRuntimeClient>();
  std::unique_ptr<sandbox::SessionManager> manager;

  explicit Fixture(std::chrono::milliseconds budget = std::chrono::seconds(30)) {
    client->add_image(kImage, runbox::runtime::ImageInfo{.id = "sha256:py", .working_dir = "/workspace"});
    client->add_image("alpine:3.20");
    auto options = sandbox::ManagerOptions::from_config(runbox::testing::mock_config());
    options.max_execution_time = budget;
    manager = std::make_unique<sandbox::SessionManager>(client, options);
  }

  std::string open(sandbox::SessionOptions options = {}) {
    if (options.base_image.empty()) {
      options.base_image = kImage;
    }
    auto id = manager->open(options);
    if (!id.ok()) {
      throw std::runtime_error("open failed: " + id.error());
    }
    return id.value();
  }
};

sandbox::RunRequest commands(std::vector<std::string> list, bool fail_fast = false) {
  return sandbox::RunRequest{.commands = std::move(list), .fail_fast = fail_fast};
}

} // namespace

void register_sessions_tests(std::vector<runbox::tests::TestCase> &tests) {
  using runbox::tests::require;
  using runbox::testing::encode_files;
  using runbox::testing::make_files;

  tests.push_back({"sessions_open_run_close", [] {
                     Fixture fx;
                     const auto id = fx.open();
                     require(id.size() == 32, "generated id is 32 hex chars");
                     require(fx.manager->state(id) == sandbox::SessionState::Ready, "ready");
                     require(fx.manager->active_sessions() == 1, "one active session");

                     auto request = commands({"cat hello.txt", "echo done"});
                     request.archive_base64 = encode_files({{"hello.txt", "hi there\n"}});
                     auto outcome = fx.manager->run(id, request);
                     require(outcome.ok(), "run should succeed: " + outcome.error());
                     const auto &results = outcome.value().results;
                     require(results.size() == 2, "two results");
                     require(results[0].output == "hi there\n", "archive extracted at root");
                     require(results[0].exit_code == 0 && results[0].workdir == ".",
                             "default workdir is the root");
                     require(!outcome.value().patch.has_value(), "no patch without extraction");

                     require(fx.manager->close(id).ok(), "close succeeds");
                     require(!fx.manager->state(id).has_value(), "session forgotten");
                     require(fx.client->container_count() == 0, "container removed");
                     require(fx.manager->active_sessions() == 0, "nothing active");
                   }});

  tests.push_back({"sessions_fail_fast_stops_at_first_failure", [] {
                     Fixture fx;
                     const auto id = fx.open();
                     auto stopped = fx.manager->run(id, commands({"echo a", "exit 3", "echo c"}, true));
                     require(stopped.ok(), "run should succeed");
                     require(stopped.value().results.size() == 2, "stopped after the failure");
                     require(stopped.value().results[1].exit_code == 3, "failure recorded");

                     auto all = fx.manager->run(id, commands({"echo a", "exit 3", "echo c"}));
                     require(all.ok() && all.value().results.size() == 3, "all commands ran");
                     require(all.value().results[2].output == "c\n", "last output");
                     require(fx.manager->state(id) == sandbox::SessionState::Ready,
                             "non-zero exit keeps the session ready");
                   }});

  tests.push_back({"sessions_state_persists_between_runs", [] {
                     Fixture fx;
                     const auto id = fx.open();
                     require(fx.manager->run(id, commands({"echo first > notes.txt"})).ok(), "first run");
                     auto second = fx.manager->run(id, commands({"cat notes.txt"}));
                     require(second.ok() && second.value().results[0].output == "first\n",
                             "files survive between runs");
                   }});

  tests.push_back({"sessions_ephemeral_clears_root", [] {
                     Fixture fx;
                     const auto id = fx.open(sandbox::SessionOptions{.ephemeral = true});
                     require(fx.manager->run(id, commands({"echo x > left.txt"})).ok(), "first run");
                     auto second = fx.manager->run(id, commands({"ls"}));
                     require(second.ok(), "second run");
                     require(second.value().results[0].output.empty(),
                             "root cleared: " + second.value().results[0].output);
                   }});

  tests.push_back({"sessions_workdir_resolution", [] {
                     Fixture fx;
                     const auto id = fx.open();
                     auto request = commands({"cat local.txt"});
                     request.archive = make_files({{"pkg/local.txt", "inside\n"}});
                     request.workdir = "./pkg/";
                     auto outcome = fx.manager->run(id, request);
                     require(outcome.ok(), "run in subdirectory: " + outcome.error());
                     require(outcome.value().results[0].output == "inside\n", "workdir applied");
                     require(outcome.value().results[0].workdir == "pkg", "normalized workdir");

                     auto fresh = commands({"pwd >/dev/null"});
                     fresh.workdir = "new/dir";
                     require(fx.manager->run(id, fresh).ok(), "missing workdir is created");

                     auto absolute = commands({"true"});
                     absolute.workdir = "/etc";
                     auto rejected = fx.manager->run(id, absolute);
                     require(!rejected.ok() && rejected.code() == ErrorCode::InvalidArgument,
                             "absolute workdir rejected");
                     auto escaping = commands({"true"});
                     escaping.workdir = "../up";
                     require(!fx.manager->run(id, escaping).ok(), "escaping workdir rejected");
                     require(fx.manager->state(id) == sandbox::SessionState::Ready,
                             "validation errors keep the session ready");
                   }});

  tests.push_back({"sessions_normalize_workdir", [] {
                     require(sandbox::normalize_workdir(std::nullopt).value().empty(), "null");
                     require(sandbox::normalize_workdir(".").value().empty(), "dot");
                     require(sandbox::normalize_workdir("a//b/./").value() == "a/b", "cleanup");
                     require(!sandbox::normalize_workdir("a/../..").ok(), "parent rejected");
                   }});

  tests.push_back({"sessions_bad_archive_keeps_session", [] {
                     Fixture fx;
                     const auto id = fx.open();
                     auto request = commands({"true"});
                     request.archive_base64 = "%%%%";
                     auto outcome = fx.manager->run(id, request);
                     require(!outcome.ok() && outcome.code() == ErrorCode::ArchiveFormat,
                             "ArchiveFormat expected");
                     require(fx.manager->state(id) == sandbox::SessionState::Ready, "still ready");
                   }});

  tests.push_back({"sessions_timeout_closes_session", [] {
                     Fixture fx(std::chrono::milliseconds(1000));
                     const auto id = fx.open();
                     const auto started = std::chrono::steady_clock::now();
                     auto outcome = fx.manager->run(id, commands({"sleep 30"}));
                     require(!outcome.ok() && outcome.code() == ErrorCode::ExecutionTimeout,
                             "ExecutionTimeout expected");
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(10),
                             "budget enforced");
                     require(fx.manager->state(id) == sandbox::SessionState::Closed,
                             "session closed by the timeout");
                     require(fx.client->container_count() == 0, "resources released");

                     auto again = fx.manager->run(id, commands({"true"}));
                     require(!again.ok() && again.code() == ErrorCode::SessionNotReady,
                             "closed session refuses work");
                     require(fx.manager->close(id).ok(), "close after timeout");
                     require(fx.manager->close(id).ok(), "second close is a no-op");
                     auto gone = fx.manager->run(id, commands({"true"}));
                     require(!gone.ok() && gone.code() == ErrorCode::SessionNotFound,
                             "closed session is unknown");
                   }});

  tests.push_back({"sessions_budget_is_cumulative", [] {
                     Fixture fx(std::chrono::milliseconds(1500));
                     const auto id = fx.open();
                     require(fx.manager->run(id, commands({"sleep 1"})).ok(), "first second fits");
                     auto second = fx.manager->run(id, commands({"sleep 1"}));
                     require(!second.ok() && second.code() == ErrorCode::ExecutionTimeout,
                             "remaining budget exhausted");
                   }});

  tests.push_back({"sessions_close_interrupts_running_command", [] {
                     Fixture fx;
                     const auto id = fx.open();
                     runbox::common::Result<sandbox::RunOutcome> outcome =
                         runbox::common::Result<sandbox::RunOutcome>::failure("not run");
                     std::thread runner(
                         [&] { outcome = fx.manager->run(id, commands({"sleep 30"})); });
                     std::this_thread::sleep_for(std::chrono::milliseconds(300));
                     require(fx.manager->close(id).ok(), "close while executing");
                     runner.join();
                     require(!outcome.ok() && outcome.code() == ErrorCode::ExecutionTimeout,
                             "running command interrupted: " + outcome.error());
                     require(!fx.manager->state(id).has_value(), "session removed");
                   }});

  tests.push_back({"sessions_extract_patch_reports_changes", [] {
                     Fixture fx;
                     const auto id = fx.open(sandbox::SessionOptions{.extract_patch = true});
                     require(fx.client->container_count() == 2, "primary and helper");
                     require(fx.client->volume_count() == 1, "shared volume");

                     const auto before = make_files({{"app.py", "print('v1')\n"},
                                                     {"old.txt", "remove me\n"},
                                                     {"same.txt", "unchanged\n"}});
                     auto request = commands({"printf \"print('v2')\\n\" > app.py",
                                              "rm old.txt", "mkdir -p out && echo new > out/new.txt",
                                              "echo secret > .env"});
                     request.archive = before;
                     auto outcome = fx.manager->run(id, request);
                     require(outcome.ok(), "run should succeed: " + outcome.error());
                     require(outcome.value().patch.has_value(), "patch produced");
                     const auto &patch = *outcome.value().patch;
                     require(patch.find("a/same.txt") == std::string::npos, "unchanged file skipped");
                     require(patch.find(".env") == std::string::npos, "hidden file skipped");
                     require(outcome.value().changed_files.find("out/new.txt") != nullptr,
                             "changed files collected");

                     auto applied = runbox::archive::apply_patch(before, patch);
                     require(applied.ok(), "patch applies: " + applied.error());
                     require(applied.value().find("app.py")->content == "print('v2')\n",
                             "modification replayed");
                     require(applied.value().find("old.txt") == nullptr, "deletion replayed");
                     require(applied.value().find("out/new.txt")->content == "new\n",
                             "creation replayed");

                     auto quiet = fx.manager->run(id, commands({"ls -la"}));
                     require(quiet.ok() && !quiet.value().patch.has_value(),
                             "read-only commands produce no patch");

                     require(fx.manager->close(id).ok(), "close");
                     require(fx.client->container_count() == 0, "both containers removed");
                     require(fx.client->volume_count() == 0, "volume removed");
                   }});

  tests.push_back({"sessions_spec_carries_limits_and_labels", [] {
                     Fixture fx;
                     const auto id = fx.open(sandbox::SessionOptions{
                         .session_id = "limits-1",
                         .limits = {.memory_bytes = 1 << 20, .cpu_shares = 512,
                                    .network_enabled = true}});
                     require(id == "limits-1", "caller id kept");
                     const auto specs = fx.client->created_specs();
                     require(specs.size() == 1, "one container");
                     const auto &spec = specs[0];
                     require(spec.name == "runbox-limits-1", "container name");
                     require(spec.memory_bytes == (1 << 20) && spec.cpu_shares == 512, "limits");
                     require(spec.network_enabled, "network flag");
                     require(spec.runtime == "runc", "runtime from config");
                     require(std::find(spec.labels.begin(), spec.labels.end(),
                                       std::make_pair(std::string("runbox.session"),
                                                      std::string("limits-1"))) != spec.labels.end(),
                             "session label");
                   }});

  tests.push_back({"sessions_duplicate_and_invalid_ids", [] {
                     Fixture fx;
                     fx.open(sandbox::SessionOptions{.session_id = "dup"});
                     auto again = fx.manager->open(
                         sandbox::SessionOptions{.session_id = "dup", .base_image = kImage});
                     require(!again.ok() && again.code() == ErrorCode::SessionExists,
                             "SessionExists expected");
                     auto invalid = fx.manager->open(
                         sandbox::SessionOptions{.session_id = "../etc", .base_image = kImage});
                     require(!invalid.ok() && invalid.code() == ErrorCode::InvalidArgument,
                             "invalid id rejected");
                     auto no_image = fx.manager->open(sandbox::SessionOptions{.base_image = " "});
                     require(!no_image.ok() && no_image.code() == ErrorCode::InvalidArgument,
                             "image required");
                   }});

  tests.push_back({"sessions_unknown_ids", [] {
                     Fixture fx;
                     auto run = fx.manager->run("nope", commands({"true"}));
                     require(!run.ok() && run.code() == ErrorCode::SessionNotFound,
                             "SessionNotFound expected");
                     require(fx.manager->close("nope").ok(), "closing unknown id succeeds");
                   }});

  tests.push_back({"sessions_pulled_image_removed_unless_kept", [] {
                     Fixture fx;
                     const auto id = fx.open(sandbox::SessionOptions{.base_image = "node:22"});
                     require(fx.client->pull_count() == 1, "image pulled");
                     require(fx.manager->close(id).ok(), "close");
                     const auto removed = fx.client->removed_images();
                     require(removed.size() == 1 && removed[0] == "node:22", "pulled image removed");

                     const auto kept = fx.open(
                         sandbox::SessionOptions{.base_image = "ruby:3", .keep_image = true});
                     require(fx.manager->close(kept).ok(), "close kept");
                     require(fx.client->removed_images().size() == 1, "kept image stays");
                     require(fx.client->has_image("ruby:3"), "image still present");

                     const auto local = fx.open();
                     require(fx.manager->close(local).ok(), "close local");
                     require(fx.client->has_image(kImage), "pre-existing image never removed");
                   }});

  tests.push_back({"sessions_open_failures_roll_back", [] {
                     Fixture fx;
                     fx.client->set_create_fails_for("-helper");
                     auto helper = fx.manager->open(
                         sandbox::SessionOptions{.base_image = kImage, .extract_patch = true});
                     require(!helper.ok() && helper.code() == ErrorCode::ContainerStart,
                             "ContainerStart expected");
                     require(fx.client->container_count() == 0, "primary rolled back");
                     require(fx.client->volume_count() == 0, "volume rolled back");
                     require(fx.manager->active_sessions() == 0, "no session registered");

                     fx.client->set_pull_fails(true);
                     auto pull = fx.manager->open(sandbox::SessionOptions{.base_image = "missing:1"});
                     require(!pull.ok() && pull.code() == ErrorCode::ImagePull, "ImagePull expected");

                     fx.client->set_never_running(true);
                     auto start = fx.manager->open(sandbox::SessionOptions{.base_image = kImage});
                     require(!start.ok() && start.code() == ErrorCode::ContainerStart,
                             "never-running container fails");
                     require(fx.client->container_count() == 0, "container removed after retries");
                   }});

  tests.push_back({"sessions_close_idle_reaps_ready_sessions", [] {
                     Fixture fx;
                     const auto id = fx.open();
                     require(fx.manager->close_idle(std::chrono::hours(1)) == 0, "fresh session kept");
                     require(fx.manager->close_idle(std::chrono::milliseconds(0)) == 1, "idle reaped");
                     require(!fx.manager->state(id).has_value(), "reaped session forgotten");
                     require(fx.client->container_count() == 0, "container removed");
                   }});

  tests.push_back({"sessions_parallel_sessions_run_independently", [] {
                     Fixture fx;
                     const auto first = fx.open();
                     const auto second = fx.open();
                     bool first_ok = false;
                     bool second_ok = false;
                     std::thread a([&] {
                       auto r = fx.manager->run(first, commands({"echo one > f.txt", "cat f.txt"}));
                       first_ok = r.ok() && r.value().results[1].output == "one\n";
                     });
                     std::thread b([&] {
                       auto r = fx.manager->run(second, commands({"echo two > f.txt", "cat f.txt"}));
                       second_ok = r.ok() && r.value().results[1].output == "two\n";
                     });
                     a.join();
                     b.join();
                     require(first_ok && second_ok, "sessions are isolated");
                     fx.manager->close_all();
                     require(fx.manager->active_sessions() == 0, "close_all");
                   }});

  tests.push_back({"sessions_same_session_runs_are_serialized", [] {
                     Fixture fx;
                     const auto id = fx.open();
                     auto writer = [&](const std::string &tag, bool &ok) {
                       auto r = fx.manager->run(
                           id, commands({"echo start-" + tag + " >> log; sleep 0.3; echo end-" +
                                         tag + " >> log"}));
                       ok = r.ok() && r.value().results.size() == 1 &&
                            r.value().results[0].exit_code == 0;
                     };
                     bool first_ok = false;
                     bool second_ok = false;
                     std::thread a([&] { writer("a", first_ok); });
                     std::thread b([&] { writer("b", second_ok); });
                     a.join();
                     b.join();
                     require(first_ok && second_ok, "both runs succeed");

                     auto log = fx.manager->run(id, commands({"cat log"}));
                     require(log.ok(), "read log: " + log.error());
                     const auto &text = log.value().results[0].output;
                     require(text == "start-a\nend-a\nstart-b\nend-b\n" ||
                                 text == "start-b\nend-b\nstart-a\nend-a\n",
                             "runs did not interleave: " + text);
                   }});

  tests.push_back({"sessions_commands_get_writable_home", [] {
                     Fixture fx;
                     const auto id = fx.open();
                     auto outcome = fx.manager->run(
                         id, commands({"for d in \"$HOME\" \"$XDG_CACHE_HOME\" \"$XDG_CONFIG_HOME\" "
                                       "\"$XDG_STATE_HOME\" \"$XDG_DATA_HOME\"; do "
                                       "test -d \"$d\" && test -w \"$d\" || echo \"missing $d\"; "
                                       "done",
                                       "echo \"$XDG_CACHE_HOME\"",
                                       "echo cached > \"$XDG_CACHE_HOME/entry\" && ls"}));
                     require(outcome.ok(), "run: " + outcome.error());
                     const auto &results = outcome.value().results;
                     require(results[0].output.empty(), "home directories: " + results[0].output);
                     require(runbox::common::ends_with(results[1].output,
                                                       "/tmp/runbox-home/.cache\n"),
                             "cache under home: " + results[1].output);
                     require(results[2].exit_code == 0 && results[2].output.empty(),
                             "home stays out of the archive root: " + results[2].output);

                     const auto env = sandbox::sandbox_environment("/h");
                     require(env.size() == 5 && env[0] == std::make_pair(std::string("HOME"),
                                                                         std::string("/h")),
                             "HOME first");
                   }});
}
