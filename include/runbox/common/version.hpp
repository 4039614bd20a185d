#pragma once

#include <string>

namespace runbox::common {

/// Release version, e.g. "0.1.0".
[[nodiscard]] std::string version();

} // namespace runbox::common
