#include "runbox/runtime/app.hpp"

#include "runbox/config/config.hpp"
#include "runbox/observability/factory.hpp"
#include "runbox/observability/global.hpp"
#include "runbox/runtime/docker_client.hpp"

namespace runbox::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::propagate(loaded);
  }
  auto warnings = config::validate_config(loaded.value());
  if (!warnings.ok()) {
    return common::Result<RuntimeContext>::propagate(warnings);
  }
  RuntimeContext context(std::move(loaded.value()));
  context.install_observer();
  for (const auto &warning : warnings.value()) {
    observability::log_warn("config", warning);
  }
  return common::Result<RuntimeContext>::success(std::move(context));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
}

std::shared_ptr<IRuntimeClient> RuntimeContext::create_runtime_client() const {
  auto runner = std::make_shared<DockerCliRunner>(config_.sandbox.docker_binary,
                                                  config_.sandbox.docker_host);
  return std::make_shared<DockerRuntimeClient>(
      std::move(runner), DockerClientOptions{.host = config_.sandbox.docker_host});
}

std::shared_ptr<sandbox::SessionManager> RuntimeContext::create_session_manager() const {
  return std::make_shared<sandbox::SessionManager>(create_runtime_client(),
                                                   sandbox::ManagerOptions::from_config(config_));
}

} // namespace runbox::runtime
