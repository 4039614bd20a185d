#pragma once

#include "runbox/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace runbox::common {

/// Escape a string for embedding inside a JSON string literal. Control bytes become \u00XX.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape the body of a JSON string literal, decoding \uXXXX (and surrogate pairs) to UTF-8.
[[nodiscard]] Result<std::string> json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level members of a JSON object, each value kept as its raw JSON text.
using JsonObject = std::unordered_map<std::string, std::string>;
[[nodiscard]] Result<JsonObject> json_parse_object(const std::string &json);

/// Raw JSON text of each element of a JSON array.
[[nodiscard]] Result<std::vector<std::string>> json_split_array(const std::string &json);

[[nodiscard]] bool json_is_null(const std::string &raw);
[[nodiscard]] std::optional<std::string> json_as_string(const std::string &raw);
[[nodiscard]] std::optional<bool> json_as_bool(const std::string &raw);
[[nodiscard]] std::optional<std::int64_t> json_as_int(const std::string &raw);
[[nodiscard]] std::optional<std::vector<std::string>>
json_as_string_array(const std::string &raw);

} // namespace runbox::common
