#pragma once

#include "llmws/config/schema.hpp"
#include "llmws/observability/observer.hpp"

#include <memory>

namespace llmws::observability {

/// LogObserver at the configured level; NoopObserver for "off".
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace llmws::observability
