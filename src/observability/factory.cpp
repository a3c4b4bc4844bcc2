#include "llmgate/observability/factory.hpp"

#include "llmgate/common/fs.hpp"
#include "llmgate/observability/log_observer.hpp"
#include "llmgate/observability/multi_observer.hpp"
#include "llmgate/observability/noop_observer.hpp"

#include <iostream>
#include <sstream>

namespace llmgate::observability {

std::shared_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_shared<NoopObserver>(backend.empty() ? "none" : backend);
  }

  if (backend == "log") {
    return std::make_shared<LogObserver>();
  }

  if (backend == "debug") {
    return std::make_shared<LogObserver>(std::cerr, LogLevel::Debug);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_shared<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::to_lower(common::trim(part));
      if (p == "log") {
        multi->add(std::make_shared<LogObserver>());
      } else if (p == "debug") {
        multi->add(std::make_shared<LogObserver>(std::cerr, LogLevel::Debug));
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_shared<NoopObserver>(p));
      }
    }
    return multi;
  }

  return std::make_shared<LogObserver>();
}

} // namespace llmgate::observability
