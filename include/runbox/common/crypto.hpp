#pragma once

#include "runbox/common/result.hpp"

#include <cstddef>
#include <string>

namespace runbox::common {

[[nodiscard]] std::string base64_encode(const std::string &bytes);
/// Strict decode; embedded whitespace (line wrapping) is ignored.
[[nodiscard]] Result<std::string> base64_decode(const std::string &text);

[[nodiscard]] std::string random_hex(std::size_t bytes);
[[nodiscard]] std::string sha256_hex(const std::string &text);
[[nodiscard]] bool constant_time_equals(const std::string &left, const std::string &right);

} // namespace runbox::common
