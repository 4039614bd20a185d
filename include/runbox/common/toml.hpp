#pragma once

#include "runbox/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace runbox::common {

using TomlValue = std::variant<std::string, bool, std::int64_t, double>;

/// Scalar subset of TOML: `[section]` headers and `key = value` lines, values typed at parse time.
/// Keys are stored dotted (`sandbox.runtime`).
class TomlTable {
public:
  [[nodiscard]] const TomlValue *find(const std::string &key) const;

  /// Typed reads return `fallback` when the key is missing or holds another type.
  [[nodiscard]] std::string string_or(const std::string &key, const std::string &fallback) const;
  [[nodiscard]] bool bool_or(const std::string &key, bool fallback) const;
  [[nodiscard]] std::int64_t int_or(const std::string &key, std::int64_t fallback) const;
  /// Integers widen to double.
  [[nodiscard]] double double_or(const std::string &key, double fallback) const;

  [[nodiscard]] std::size_t size() const { return entries_.size(); }

private:
  friend Result<TomlTable> parse_toml(const std::string &content);

  std::map<std::string, TomlValue> entries_;
};

[[nodiscard]] Result<TomlTable> parse_toml(const std::string &content);

} // namespace runbox::common
