#pragma once

#include "runbox/common/cancellation.hpp"
#include "runbox/common/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace runbox::runtime {

struct DockerCommandOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{60'000};
  std::optional<std::chrono::steady_clock::time_point> deadline;
  const common::CancellationToken *cancel = nullptr;
  std::string stdin_data;
  bool merge_output = false;
};

struct DockerProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool cancelled = false;
};

/// Runs one docker CLI invocation. Replaced by fakes in tests.
class IDockerRunner {
public:
  virtual ~IDockerRunner() = default;

  [[nodiscard]] virtual common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) = 0;
};

class DockerCliRunner final : public IDockerRunner {
public:
  explicit DockerCliRunner(std::string binary = "docker", std::string host = "");

  [[nodiscard]] common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) override;

private:
  std::string binary_;
  std::string host_;
};

} // namespace runbox::runtime
