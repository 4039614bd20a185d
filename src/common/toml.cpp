#include "runbox/common/toml.hpp"

#include "runbox/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <optional>
#include <sstream>

namespace runbox::common {

namespace {

struct LineCursor {
  const std::string &text;
  std::size_t pos = 0;

  [[nodiscard]] bool done() const { return pos >= text.size(); }
  [[nodiscard]] char peek() const { return done() ? '\0' : text[pos]; }

  void skip_blank() {
    while (!done() && (text[pos] == ' ' || text[pos] == '\t')) {
      ++pos;
    }
  }

  /// True when only whitespace or a comment is left.
  [[nodiscard]] bool at_line_end() {
    skip_blank();
    return done() || peek() == '#';
  }
};

bool is_bare_key_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-' || ch == '.';
}

Result<std::string> read_basic_string(LineCursor &cursor) {
  ++cursor.pos;
  std::string out;
  while (!cursor.done()) {
    const char ch = cursor.text[cursor.pos++];
    if (ch == '"') {
      return Result<std::string>::success(std::move(out));
    }
    if (ch != '\\') {
      out.push_back(ch);
      continue;
    }
    if (cursor.done()) {
      break;
    }
    switch (cursor.text[cursor.pos++]) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case '"':
      out.push_back('"');
      break;
    case '\\':
      out.push_back('\\');
      break;
    default:
      return Result<std::string>::failure(ErrorCode::InvalidArgument, "unknown escape sequence");
    }
  }
  return Result<std::string>::failure(ErrorCode::InvalidArgument, "unterminated string");
}

Result<std::string> read_literal_string(LineCursor &cursor) {
  const auto close = cursor.text.find('\'', cursor.pos + 1);
  if (close == std::string::npos) {
    return Result<std::string>::failure(ErrorCode::InvalidArgument, "unterminated string");
  }
  std::string out = cursor.text.substr(cursor.pos + 1, close - cursor.pos - 1);
  cursor.pos = close + 1;
  return Result<std::string>::success(std::move(out));
}

std::optional<TomlValue> parse_scalar(const std::string &token) {
  if (token == "true") {
    return TomlValue{true};
  }
  if (token == "false") {
    return TomlValue{false};
  }

  std::string digits;
  for (const char ch : token) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  if (!digits.empty() && digits.front() == '+') {
    digits.erase(0, 1);
  }
  if (digits.empty()) {
    return std::nullopt;
  }
  const char *first = digits.data();
  const char *last = first + digits.size();

  if (digits.find_first_of(".eE") == std::string::npos) {
    std::int64_t integer = 0;
    auto [ptr, ec] = std::from_chars(first, last, integer);
    if (ec == std::errc() && ptr == last) {
      return TomlValue{integer};
    }
    return std::nullopt;
  }
  double real = 0.0;
  auto [ptr, ec] = std::from_chars(first, last, real);
  if (ec == std::errc() && ptr == last) {
    return TomlValue{real};
  }
  return std::nullopt;
}

Result<TomlValue> read_value(LineCursor &cursor) {
  cursor.skip_blank();
  if (cursor.peek() == '"' || cursor.peek() == '\'') {
    auto text = cursor.peek() == '"' ? read_basic_string(cursor) : read_literal_string(cursor);
    if (!text.ok()) {
      return Result<TomlValue>::propagate(text);
    }
    return Result<TomlValue>::success(TomlValue{std::move(text.value())});
  }
  if (cursor.peek() == '[' || cursor.peek() == '{') {
    return Result<TomlValue>::failure(ErrorCode::InvalidArgument,
                                      "arrays and inline tables are not supported");
  }

  const auto comment = cursor.text.find('#', cursor.pos);
  const std::string token = trim(cursor.text.substr(
      cursor.pos, comment == std::string::npos ? std::string::npos : comment - cursor.pos));
  cursor.pos = comment == std::string::npos ? cursor.text.size() : comment;
  if (token.empty()) {
    return Result<TomlValue>::failure(ErrorCode::InvalidArgument, "missing value");
  }
  auto scalar = parse_scalar(token);
  if (!scalar.has_value()) {
    return Result<TomlValue>::failure(ErrorCode::InvalidArgument,
                                      "unsupported value '" + token + "'");
  }
  return Result<TomlValue>::success(std::move(*scalar));
}

Result<std::string> read_key(LineCursor &cursor) {
  cursor.skip_blank();
  if (cursor.peek() == '"') {
    return read_basic_string(cursor);
  }
  const std::size_t start = cursor.pos;
  while (!cursor.done() && is_bare_key_char(cursor.peek())) {
    ++cursor.pos;
  }
  if (cursor.pos == start) {
    return Result<std::string>::failure(ErrorCode::InvalidArgument, "expected a key");
  }
  return Result<std::string>::success(cursor.text.substr(start, cursor.pos - start));
}

Result<std::string> read_section(LineCursor &cursor) {
  ++cursor.pos;
  if (cursor.peek() == '[') {
    return Result<std::string>::failure(ErrorCode::InvalidArgument,
                                        "arrays of tables are not supported");
  }
  const auto close = cursor.text.find(']', cursor.pos);
  if (close == std::string::npos) {
    return Result<std::string>::failure(ErrorCode::InvalidArgument, "unterminated section header");
  }
  const std::string name = trim(cursor.text.substr(cursor.pos, close - cursor.pos));
  cursor.pos = close + 1;
  if (name.empty()) {
    return Result<std::string>::failure(ErrorCode::InvalidArgument, "empty section name");
  }
  for (const char ch : name) {
    if (!is_bare_key_char(ch)) {
      return Result<std::string>::failure(ErrorCode::InvalidArgument,
                                          "invalid section name '" + name + "'");
    }
  }
  return Result<std::string>::success(name);
}

} // namespace

const TomlValue *TomlTable::find(const std::string &key) const {
  const auto it = entries_.find(key);
  return it == entries_.end() ? nullptr : &it->second;
}

std::string TomlTable::string_or(const std::string &key, const std::string &fallback) const {
  const auto *value = find(key);
  if (value == nullptr || !std::holds_alternative<std::string>(*value)) {
    return fallback;
  }
  return std::get<std::string>(*value);
}

bool TomlTable::bool_or(const std::string &key, const bool fallback) const {
  const auto *value = find(key);
  if (value == nullptr || !std::holds_alternative<bool>(*value)) {
    return fallback;
  }
  return std::get<bool>(*value);
}

std::int64_t TomlTable::int_or(const std::string &key, const std::int64_t fallback) const {
  const auto *value = find(key);
  if (value == nullptr || !std::holds_alternative<std::int64_t>(*value)) {
    return fallback;
  }
  return std::get<std::int64_t>(*value);
}

double TomlTable::double_or(const std::string &key, const double fallback) const {
  const auto *value = find(key);
  if (value == nullptr) {
    return fallback;
  }
  if (const auto *real = std::get_if<double>(value); real != nullptr) {
    return *real;
  }
  if (const auto *integer = std::get_if<std::int64_t>(value); integer != nullptr) {
    return static_cast<double>(*integer);
  }
  return fallback;
}

Result<TomlTable> parse_toml(const std::string &content) {
  TomlTable table;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  const auto fail = [&line_number](const std::string &message) {
    return Result<TomlTable>::failure(ErrorCode::InvalidArgument,
                                      "line " + std::to_string(line_number) + ": " + message);
  };

  while (std::getline(stream, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    LineCursor cursor{line};
    if (cursor.at_line_end()) {
      continue;
    }

    if (cursor.peek() == '[') {
      auto name = read_section(cursor);
      if (!name.ok()) {
        return fail(name.error());
      }
      if (!cursor.at_line_end()) {
        return fail("unexpected text after section header");
      }
      section = name.value();
      continue;
    }

    auto key = read_key(cursor);
    if (!key.ok()) {
      return fail(key.error());
    }
    cursor.skip_blank();
    if (cursor.peek() != '=') {
      return fail("expected '=' after key '" + key.value() + "'");
    }
    ++cursor.pos;
    auto value = read_value(cursor);
    if (!value.ok()) {
      return fail(value.error());
    }
    if (!cursor.at_line_end()) {
      return fail("unexpected text after value");
    }

    const std::string full_key = section.empty() ? key.value() : section + "." + key.value();
    if (!table.entries_.emplace(full_key, std::move(value.value())).second) {
      return fail("duplicate key '" + full_key + "'");
    }
  }

  return Result<TomlTable>::success(std::move(table));
}

} // namespace runbox::common
