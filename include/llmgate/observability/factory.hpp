#pragma once

#include "llmgate/config/schema.hpp"
#include "llmgate/observability/observer.hpp"

#include <memory>

namespace llmgate::observability {

[[nodiscard]] std::shared_ptr<IObserver> create_observer(const config::Config &config);

} // namespace llmgate::observability
