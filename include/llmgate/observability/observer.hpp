#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace llmgate::observability {

using Attributes = std::map<std::string, std::string>;

enum class LogLevel { Debug, Info, Warn, Error };

enum class SpanStatus { Unset, Ok, Error };

struct SpanStartEvent {
  std::uint64_t span_id = 0;
  std::optional<std::uint64_t> parent_id;
  std::string name;
  Attributes attributes;
};

struct SpanEndEvent {
  std::uint64_t span_id = 0;
  std::string name;
  SpanStatus status = SpanStatus::Unset;
  std::chrono::milliseconds duration{0};
  Attributes attributes;
  std::optional<std::string> error;
};

struct LogEvent {
  LogLevel level = LogLevel::Info;
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SpanStartEvent, SpanEndEvent, LogEvent, ErrorEvent>;

struct CounterMetric {
  std::string name;
  std::int64_t value = 0;
  Attributes labels;
};

struct LatencyMetric {
  std::string name;
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<CounterMetric, LatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

[[nodiscard]] std::string_view to_string(LogLevel level);
[[nodiscard]] std::string_view to_string(SpanStatus status);

} // namespace llmgate::observability
