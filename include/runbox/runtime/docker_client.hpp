#pragma once

#include "runbox/runtime/client.hpp"
#include "runbox/runtime/docker.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace runbox::runtime {

struct DockerClientOptions {
  /// Engine address: unix:///path.sock or tcp://host:port. Empty means the local socket.
  std::string host;
  std::chrono::milliseconds command_timeout{60'000};
  std::chrono::milliseconds pull_timeout{600'000};
  std::chrono::milliseconds ping_timeout{2'000};
};

/// Engine endpoint for `GET /_ping`: (url, unix socket path or empty).
[[nodiscard]] std::pair<std::string, std::string> resolve_ping_endpoint(const std::string &host);

[[nodiscard]] std::vector<std::string> build_docker_create_args(const ContainerSpec &spec);

/// Drives the engine through the docker CLI; liveness goes straight to the engine API.
class DockerRuntimeClient final : public IRuntimeClient {
public:
  DockerRuntimeClient(std::shared_ptr<IDockerRunner> runner, DockerClientOptions options = {});

  [[nodiscard]] common::Result<bool> image_exists(const std::string &image) override;
  [[nodiscard]] common::Status pull_image(const std::string &image) override;
  [[nodiscard]] common::Result<ImageInfo> inspect_image(const std::string &image) override;
  [[nodiscard]] common::Status remove_image(const std::string &image) override;

  [[nodiscard]] common::Result<std::string> create_container(const ContainerSpec &spec) override;
  [[nodiscard]] common::Status start_container(const std::string &container) override;
  [[nodiscard]] common::Result<bool> is_running(const std::string &container) override;
  [[nodiscard]] common::Result<ExecResult> exec(const std::string &container,
                                                const ExecRequest &request) override;
  [[nodiscard]] common::Status copy_in(const std::string &container, const std::string &dest_dir,
                                       const std::string &tar_bytes) override;
  [[nodiscard]] common::Status stop_container(const std::string &container) override;
  [[nodiscard]] common::Status remove_container(const std::string &container) override;

  [[nodiscard]] common::Status create_volume(const std::string &name) override;
  [[nodiscard]] common::Status remove_volume(const std::string &name) override;

  [[nodiscard]] bool ping() override;

private:
  std::shared_ptr<IDockerRunner> runner_;
  DockerClientOptions options_;
};

} // namespace runbox::runtime
