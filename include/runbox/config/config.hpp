#pragma once

#include "runbox/common/result.hpp"
#include "runbox/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runbox::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

void apply_env_overrides(Config &config);

/// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

} // namespace runbox::config
