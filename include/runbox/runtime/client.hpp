#pragma once

#include "runbox/common/cancellation.hpp"
#include "runbox/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace runbox::runtime {

struct ImageInfo {
  std::string id;
  std::string working_dir;
  std::string user;
};

struct VolumeMount {
  std::string volume;
  std::string target;
  bool read_only = false;
};

struct ContainerSpec {
  std::string name;
  std::string image;
  /// OCI runtime name (runc, runsc); empty uses the engine default.
  std::string runtime;
  std::vector<std::pair<std::string, std::string>> labels;
  std::uint64_t memory_bytes = 0;
  std::uint64_t cpu_shares = 0;
  bool network_enabled = false;
  std::string hostname = "sandbox";
  std::vector<VolumeMount> mounts;
  std::string entrypoint;
  std::vector<std::string> command;
};

struct ExecRequest {
  std::vector<std::string> argv;
  std::string workdir;
  std::string user;
  /// Extra environment for the process, on top of the image's.
  std::vector<std::pair<std::string, std::string>> env;
  std::string stdin_data;
  bool merge_output = true;
  std::optional<std::chrono::steady_clock::time_point> deadline;
  const common::CancellationToken *cancel = nullptr;
};

struct ExecResult {
  int exit_code = 0;
  /// Merged stdout+stderr when the request asked for it, stdout otherwise.
  std::string output;
  std::string error_output;
  bool timed_out = false;
  bool cancelled = false;
};

/// Capability surface of the container engine used by sessions.
class IRuntimeClient {
public:
  virtual ~IRuntimeClient() = default;

  [[nodiscard]] virtual common::Result<bool> image_exists(const std::string &image) = 0;
  [[nodiscard]] virtual common::Status pull_image(const std::string &image) = 0;
  [[nodiscard]] virtual common::Result<ImageInfo> inspect_image(const std::string &image) = 0;
  [[nodiscard]] virtual common::Status remove_image(const std::string &image) = 0;

  /// Returns the engine's container id.
  [[nodiscard]] virtual common::Result<std::string> create_container(const ContainerSpec &spec) = 0;
  [[nodiscard]] virtual common::Status start_container(const std::string &container) = 0;
  [[nodiscard]] virtual common::Result<bool> is_running(const std::string &container) = 0;
  [[nodiscard]] virtual common::Result<ExecResult> exec(const std::string &container,
                                                        const ExecRequest &request) = 0;
  /// Extract an uncompressed tar stream into `dest_dir`, keeping entry mtimes.
  [[nodiscard]] virtual common::Status copy_in(const std::string &container,
                                               const std::string &dest_dir,
                                               const std::string &tar_bytes) = 0;
  [[nodiscard]] virtual common::Status stop_container(const std::string &container) = 0;
  [[nodiscard]] virtual common::Status remove_container(const std::string &container) = 0;

  [[nodiscard]] virtual common::Status create_volume(const std::string &name) = 0;
  [[nodiscard]] virtual common::Status remove_volume(const std::string &name) = 0;

  [[nodiscard]] virtual bool ping() = 0;
};

} // namespace runbox::runtime
