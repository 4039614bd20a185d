#include "runbox/runtime/docker.hpp"

#include "runbox/common/fs.hpp"
#include "runbox/common/process.hpp"

namespace runbox::runtime {

DockerCliRunner::DockerCliRunner(std::string binary, std::string host)
    : binary_(std::move(binary)), host_(std::move(host)) {}

common::Result<DockerProcessResult>
DockerCliRunner::run(const std::vector<std::string> &args, const DockerCommandOptions &options) {
  if (args.empty()) {
    return common::Result<DockerProcessResult>::failure(common::ErrorCode::InvalidArgument,
                                                        "docker command is empty");
  }

  std::vector<std::string> argv;
  argv.reserve(args.size() + 2);
  if (!host_.empty()) {
    argv.push_back("--host");
    argv.push_back(host_);
  }
  argv.insert(argv.end(), args.begin(), args.end());

  auto spawned = common::run_process(binary_, argv,
                                     common::ProcessOptions{.timeout = options.timeout,
                                                            .deadline = options.deadline,
                                                            .cancel = options.cancel,
                                                            .stdin_data = options.stdin_data,
                                                            .merge_output = options.merge_output});
  if (!spawned.ok()) {
    return common::Result<DockerProcessResult>::failure(common::ErrorCode::RuntimeUnavailable,
                                                        spawned.error());
  }

  auto &process = spawned.value();
  DockerProcessResult result{.exit_code = process.exit_code,
                             .stdout_text = std::move(process.stdout_text),
                             .stderr_text = std::move(process.stderr_text),
                             .timed_out = process.timed_out,
                             .cancelled = process.cancelled};

  if ((result.timed_out || result.cancelled) && !options.allow_failure) {
    return common::Result<DockerProcessResult>::failure(
        common::ErrorCode::RuntimeUnavailable,
        std::string(result.cancelled ? "docker command cancelled: " : "docker command timed out: ") +
            common::join(args, " "));
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string detail = common::trim(result.stderr_text);
    return common::Result<DockerProcessResult>::failure(
        common::ErrorCode::RuntimeUnavailable,
        detail.empty() ? "docker command failed: " + common::join(args, " ") : detail);
  }

  return common::Result<DockerProcessResult>::success(std::move(result));
}

} // namespace runbox::runtime
