#pragma once

#include "runbox/config/schema.hpp"
#include "runbox/observability/observer.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace runbox::observability {

enum class ObserverBackend { Log, None };

/// Accepts `log`, `none` and `noop`, case-insensitive.
[[nodiscard]] std::optional<ObserverBackend> parse_observer_backend(std::string_view text);

/// Unknown backends fall back to the log observer; `validate_config` rejects them first.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace runbox::observability
