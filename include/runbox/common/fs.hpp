#pragma once

#include "runbox/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runbox::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char separator);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &separator);
[[nodiscard]] std::optional<std::int64_t> parse_int(const std::string &value);
[[nodiscard]] std::optional<bool> parse_bool(const std::string &value);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

} // namespace runbox::common
