#include "runbox/common/json_util.hpp"

#include "runbox/common/fs.hpp"

#include <cctype>
#include <cstdio>

namespace runbox::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::optional<std::uint32_t> parse_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

// End of a scalar literal (number, true, false, null).
std::size_t find_literal_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

// Position one past the value starting at pos, or npos when malformed.
std::size_t find_value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  const auto end = find_literal_end(json, pos);
  return end == pos ? std::string::npos : end;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20 || ch == 0x7F) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

Result<std::string> json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\') {
      out.push_back(ch);
      continue;
    }
    if (++i >= raw.size()) {
      return Result<std::string>::failure(ErrorCode::InvalidArgument,
                                          "dangling escape in JSON string");
    }
    switch (raw[i]) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case '"':
    case '\\':
    case '/':
      out.push_back(raw[i]);
      break;
    case 'u': {
      auto unit = parse_hex4(raw, i + 1);
      if (!unit.has_value()) {
        return Result<std::string>::failure(ErrorCode::InvalidArgument,
                                            "invalid \\u escape in JSON string");
      }
      i += 4;
      std::uint32_t code_point = *unit;
      if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 6 < raw.size() &&
          raw[i + 1] == '\\' && raw[i + 2] == 'u') {
        auto low = parse_hex4(raw, i + 3);
        if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      return Result<std::string>::failure(ErrorCode::InvalidArgument,
                                          "invalid escape in JSON string");
    }
  }
  return Result<std::string>::success(std::move(out));
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

Result<JsonObject> json_parse_object(const std::string &json) {
  JsonObject result;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return Result<JsonObject>::failure(ErrorCode::InvalidArgument, "expected a JSON object");
  }
  const auto close = json_find_matching_token(json, pos, '{', '}');
  if (close == std::string::npos || json_skip_ws(json, close + 1) != json.size()) {
    return Result<JsonObject>::failure(ErrorCode::InvalidArgument, "malformed JSON object");
  }

  ++pos;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos == close) {
      break;
    }
    if (json[pos] != '"') {
      return Result<JsonObject>::failure(ErrorCode::InvalidArgument,
                                         "expected a key in JSON object");
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos || key_end >= close) {
      return Result<JsonObject>::failure(ErrorCode::InvalidArgument, "unterminated JSON key");
    }
    auto key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    if (!key.ok()) {
      return Result<JsonObject>::propagate(key);
    }

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= close || json[pos] != ':') {
      return Result<JsonObject>::failure(ErrorCode::InvalidArgument,
                                         "expected ':' after JSON key");
    }
    pos = json_skip_ws(json, pos + 1);
    const auto value_end = find_value_end(json, pos);
    if (value_end == std::string::npos || value_end > close) {
      return Result<JsonObject>::failure(ErrorCode::InvalidArgument,
                                         "malformed value for key '" + key.value() + "'");
    }
    result[key.value()] = json.substr(pos, value_end - pos);

    pos = json_skip_ws(json, value_end);
    if (pos < close && json[pos] == ',') {
      ++pos;
    } else if (pos != close) {
      return Result<JsonObject>::failure(ErrorCode::InvalidArgument,
                                         "expected ',' between JSON members");
    }
  }

  return Result<JsonObject>::success(std::move(result));
}

Result<std::vector<std::string>> json_split_array(const std::string &json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '[') {
    return Result<std::vector<std::string>>::failure(ErrorCode::InvalidArgument,
                                                     "expected a JSON array");
  }
  const auto close = json_find_matching_token(json, pos, '[', ']');
  if (close == std::string::npos) {
    return Result<std::vector<std::string>>::failure(ErrorCode::InvalidArgument,
                                                     "malformed JSON array");
  }

  ++pos;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos == close) {
      break;
    }
    const auto end = find_value_end(json, pos);
    if (end == std::string::npos || end > close) {
      return Result<std::vector<std::string>>::failure(ErrorCode::InvalidArgument,
                                                       "malformed JSON array element");
    }
    out.push_back(json.substr(pos, end - pos));
    pos = json_skip_ws(json, end);
    if (pos < close && json[pos] == ',') {
      ++pos;
    } else if (pos != close) {
      return Result<std::vector<std::string>>::failure(ErrorCode::InvalidArgument,
                                                       "expected ',' between array elements");
    }
  }
  return Result<std::vector<std::string>>::success(std::move(out));
}

bool json_is_null(const std::string &raw) { return trim(raw) == "null"; }

std::optional<std::string> json_as_string(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2 || value.front() != '"' || json_find_string_end(value, 0) != value.size() - 1) {
    return std::nullopt;
  }
  auto unescaped = json_unescape(value.substr(1, value.size() - 2));
  if (!unescaped.ok()) {
    return std::nullopt;
  }
  return unescaped.value();
}

std::optional<bool> json_as_bool(const std::string &raw) {
  const std::string value = trim(raw);
  if (value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::int64_t> json_as_int(const std::string &raw) { return parse_int(raw); }

std::optional<std::vector<std::string>> json_as_string_array(const std::string &raw) {
  auto elements = json_split_array(raw);
  if (!elements.ok()) {
    return std::nullopt;
  }
  std::vector<std::string> out;
  out.reserve(elements.value().size());
  for (const auto &element : elements.value()) {
    auto text = json_as_string(element);
    if (!text.has_value()) {
      return std::nullopt;
    }
    out.push_back(std::move(*text));
  }
  return out;
}

} // namespace runbox::common
