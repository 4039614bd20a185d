#pragma once

#include "runbox/common/result.hpp"
#include "runbox/config/schema.hpp"
#include "runbox/runtime/client.hpp"
#include "runbox/sandbox/manager.hpp"

#include <memory>

namespace runbox::runtime {

/// Loaded configuration plus the factories wiring the engine client and session manager.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  /// Loads and validates the configuration; warnings are logged.
  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Installs the global observer for this configuration.
  void install_observer() const;
  [[nodiscard]] std::shared_ptr<IRuntimeClient> create_runtime_client() const;
  [[nodiscard]] std::shared_ptr<sandbox::SessionManager> create_session_manager() const;

private:
  config::Config config_;
};

} // namespace runbox::runtime
