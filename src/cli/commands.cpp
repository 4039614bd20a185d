#include "runbox/cli/commands.hpp"

#include "runbox/common/crypto.hpp"
#include "runbox/common/fs.hpp"
#include "runbox/common/version.hpp"
#include "runbox/config/config.hpp"
#include "runbox/gateway/server.hpp"
#include "runbox/languages/runner.hpp"
#include "runbox/observability/global.hpp"
#include "runbox/runtime/app.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace runbox::cli {

namespace {

std::atomic<bool> g_stop_requested{false};

void request_stop(int) { g_stop_requested = true; }

std::string version_string() { return "runbox " + common::version(); }

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--") {
      break;
    }
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

int report(const common::Status &status) {
  std::cerr << "error (" << common::error_code_name(status.code()) << "): " << status.error()
            << "\n";
  return 1;
}

int run_serve(std::vector<std::string> args) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return report(context.status());
  }
  const auto &cfg = context.value().config();

  gateway::GatewayOptions options;
  options.host = cfg.server.host;
  options.port = cfg.server.port;
  options.session_idle_timeout = std::chrono::seconds(cfg.sandbox.session_idle_timeout_secs);

  std::string value;
  if (take_option(args, "--host", "", value)) {
    options.host = value;
  }
  if (take_option(args, "--port", "-p", value)) {
    const auto port = common::parse_int(value);
    if (!port.has_value() || *port <= 0 || *port > 65535) {
      std::cerr << "invalid port: " << value << "\n";
      return 1;
    }
    options.port = static_cast<std::uint16_t>(*port);
  }
  std::int64_t duration = 0;
  if (take_option(args, "--duration-secs", "", value)) {
    duration = common::parse_int(value).value_or(0);
  }

  auto manager = context.value().create_session_manager();
  if (!manager->ping()) {
    std::cerr << "warning: container engine is not reachable\n";
  }

  gateway::GatewayServer server(cfg, manager);
  auto status = server.start(options);
  if (!status.ok()) {
    return report(status);
  }
  std::cout << "runbox listening on " << options.host << ":" << server.port()
            << cfg.server.api_prefix << "\n";

  std::signal(SIGINT, request_stop);
  std::signal(SIGTERM, request_stop);
  const auto started = std::chrono::steady_clock::now();
  while (!g_stop_requested) {
    if (duration > 0 && std::chrono::steady_clock::now() - started >= std::chrono::seconds(duration)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  server.stop();
  manager->close_all();
  observability::flush_global_observer();
  return 0;
}

int run_exec(std::vector<std::string> args) {
  std::string image;
  if (!take_option(args, "--image", "-i", image)) {
    std::cerr << "usage: runboxd exec --image IMAGE [--archive FILE] [--workdir DIR] "
                 "[--fail-fast] [--patch] [--network|--no-network] -- COMMAND...\n";
    return 1;
  }
  std::string archive_path;
  std::string workdir;
  (void)take_option(args, "--archive", "-a", archive_path);
  const bool has_workdir = take_option(args, "--workdir", "-w", workdir);
  const bool fail_fast = take_flag(args, "--fail-fast");
  const bool patch = take_flag(args, "--patch");
  const bool network_on = take_flag(args, "--network");
  const bool network_off = take_flag(args, "--no-network");
  if (!args.empty() && args.front() == "--") {
    args.erase(args.begin());
  }

  sandbox::RunRequest request{.commands = args, .fail_fast = fail_fast};
  if (has_workdir) {
    request.workdir = workdir;
  }
  if (!archive_path.empty()) {
    auto bytes = common::read_file(common::expand_path(archive_path));
    if (!bytes.ok()) {
      return report(bytes.status());
    }
    request.archive_base64 = common::base64_encode(bytes.value());
  }

  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return report(context.status());
  }
  const auto &cfg = context.value().config();
  auto manager = context.value().create_session_manager();

  const bool network = !network_off && (network_on || cfg.sandbox.default_network_enabled);
  auto session_id = manager->open(sandbox::SessionOptions{
      .base_image = image,
      .limits = sandbox::ResourceLimits{.memory_bytes = cfg.sandbox.default_memory_bytes,
                                        .cpu_shares = cfg.sandbox.default_cpu_shares,
                                        .network_enabled = network},
      .extract_patch = patch});
  if (!session_id.ok()) {
    return report(session_id.status());
  }
  auto outcome = manager->run(session_id.value(), request);
  if (auto closed = manager->close(session_id.value()); !closed.ok()) {
    std::cerr << closed.error() << "\n";
  }
  if (!outcome.ok()) {
    return report(outcome.status());
  }

  int exit_code = 0;
  for (const auto &result : outcome.value().results) {
    std::cout << "$ " << result.command << "\n" << result.output;
    if (!result.output.empty() && result.output.back() != '\n') {
      std::cout << "\n";
    }
    std::cout << "[exit " << result.exit_code << "]\n";
    exit_code = result.exit_code;
  }
  if (outcome.value().patch.has_value()) {
    std::cout << *outcome.value().patch;
  }
  return exit_code == 0 ? 0 : 1;
}

int run_snippet(std::vector<std::string> args) {
  languages::CodeRequest request;
  request.language = "python";
  std::string value;
  if (take_option(args, "--language", "-l", value)) {
    request.language = value;
  }
  while (take_option(args, "--dep", "-d", value)) {
    request.dependencies.push_back(value);
  }
  if (take_option(args, "--file", "-f", value)) {
    auto code = common::read_file(common::expand_path(value));
    if (!code.ok()) {
      return report(code.status());
    }
    request.code = code.value();
  } else {
    request.code = read_stdin_all();
  }

  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return report(context.status());
  }
  auto manager = context.value().create_session_manager();
  auto result = languages::run_code(*manager, request);
  if (!result.ok()) {
    return report(result.status());
  }
  std::cout << result.value().output;
  return result.value().exit_code == 0 ? 0 : 1;
}

int run_ping() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return report(context.status());
  }
  if (context.value().create_runtime_client()->ping()) {
    std::cout << "ok\n";
    return 0;
  }
  std::cout << "unavailable\n";
  return 1;
}

int run_config(std::vector<std::string> args) {
  const std::string action = args.empty() ? "show" : args[0];
  if (action == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      return report(path.status());
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return report(cfg.status());
  }
  auto validation = config::validate_config(cfg.value());
  if (action == "validate") {
    if (!validation.ok()) {
      return report(validation.status());
    }
    for (const auto &warning : validation.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "configuration is valid\n";
    return 0;
  }
  if (action != "show") {
    std::cerr << "usage: runboxd config [show|path|validate]\n";
    return 1;
  }

  const auto &c = cfg.value();
  std::cout << "environment = " << c.environment << "\n";
  std::cout << "server.host = " << c.server.host << "\n";
  std::cout << "server.port = " << c.server.port << "\n";
  std::cout << "server.api_prefix = " << c.server.api_prefix << "\n";
  std::cout << "server.api_key = " << (c.server.api_key.empty() ? "(unset)" : "(set)") << "\n";
  std::cout << "sandbox.runtime = " << c.sandbox.runtime << "\n";
  std::cout << "sandbox.docker_host = "
            << (c.sandbox.docker_host.empty() ? "(default)" : c.sandbox.docker_host) << "\n";
  std::cout << "sandbox.max_execution_time = " << c.sandbox.max_execution_time_secs << "\n";
  std::cout << "sandbox.keep_template = " << (c.sandbox.keep_template ? "true" : "false") << "\n";
  std::cout << "sandbox.network_enabled = "
            << (c.sandbox.default_network_enabled ? "true" : "false") << "\n";
  std::cout << "sandbox.helper_image = " << c.sandbox.helper_image << "\n";
  std::cout << "observability.log_level = " << c.observability.log_level << "\n";
  std::cout << "error_tracking.sentry_dsn = "
            << (c.error_tracking.sentry_dsn.empty() ? "(unset)" : "(set)") << "\n";
  if (!validation.ok()) {
    std::cout << "invalid: " << validation.error() << "\n";
    return 1;
  }
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: runboxd [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  serve     Start the HTTP API (--host, --port, --duration-secs)\n";
  std::cout << "  exec      Run commands in a one-shot session (--image, --archive, --workdir,\n";
  std::cout << "            --fail-fast, --patch, --network, --no-network) -- COMMAND...\n";
  std::cout << "  code      Run a code snippet (--language, --dep, --file or stdin)\n";
  std::cout << "  ping      Check that the container engine answers\n";
  std::cout << "  config    show | path | validate\n";
  std::cout << "  version   Show version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "exec") {
    return run_exec(std::move(args));
  }
  if (subcommand == "code") {
    return run_snippet(std::move(args));
  }
  if (subcommand == "ping") {
    return run_ping();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace runbox::cli
