#pragma once

#include "runbox/common/cancellation.hpp"
#include "runbox/common/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace runbox::common {

struct ProcessOptions {
  std::chrono::milliseconds timeout{30'000};
  /// Absolute deadline; the earlier of this and `timeout` applies.
  std::optional<std::chrono::steady_clock::time_point> deadline;
  const CancellationToken *cancel = nullptr;
  std::string stdin_data;
  /// Route stderr into the stdout buffer, preserving interleaving.
  bool merge_output = false;
  std::optional<std::string> working_dir;
  /// Added to, or replacing, the parent environment.
  std::vector<std::pair<std::string, std::string>> env;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool cancelled = false;
};

/// Spawn `program` (PATH lookup) in its own process group and collect its output. Failure
/// means the process could not be started; non-zero exits are reported in the result.
[[nodiscard]] Result<ProcessResult> run_process(const std::string &program,
                                                const std::vector<std::string> &args,
                                                const ProcessOptions &options = {});

} // namespace runbox::common
