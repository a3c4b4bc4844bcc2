#pragma once

#include "llmgate/observability/observer.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace llmgate::observability {

inline constexpr const char *COUNTER_TOKENS_TOTAL = "llm_tokens_total";
inline constexpr const char *COUNTER_FAILURES_TOTAL = "llm_failures_total";
inline constexpr const char *COUNTER_FALLBACK_TOTAL = "llm_provider_fallback_total";
inline constexpr const char *COUNTER_BUDGET_ABORT_TOTAL = "llm_budget_abort_total";
inline constexpr const char *COUNTER_SSE_CONSUMERS = "llm_sse_consumer_count";

/// Named counters keyed by label set. Safe for concurrent increments.
class Counters {
public:
  explicit Counters(std::shared_ptr<IObserver> observer = nullptr);

  void add(const std::string &name, std::int64_t value, const Attributes &labels = {});

  [[nodiscard]] std::int64_t total(const std::string &name) const;
  [[nodiscard]] std::int64_t value(const std::string &name, const Attributes &labels) const;
  [[nodiscard]] std::vector<std::pair<Attributes, std::int64_t>>
  series(const std::string &name) const;

  void reset();

private:
  std::shared_ptr<IObserver> observer_;
  mutable std::mutex mutex_;
  std::map<std::string, std::map<Attributes, std::int64_t>> values_;
};

} // namespace llmgate::observability
