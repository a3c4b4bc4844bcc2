#include "llmgate/observability/log_observer.hpp"

#include <iostream>
#include <sstream>
#include <type_traits>

namespace llmgate::observability {

namespace {

std::string format_attributes(const Attributes &attributes) {
  std::ostringstream out;
  for (const auto &[key, value] : attributes) {
    out << ' ' << key << '=' << value;
  }
  return out.str();
}

int severity(const LogLevel level) { return static_cast<int>(level); }

} // namespace

std::string_view to_string(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::string_view to_string(const SpanStatus status) {
  switch (status) {
  case SpanStatus::Unset:
    return "unset";
  case SpanStatus::Ok:
    return "ok";
  case SpanStatus::Error:
    return "error";
  }
  return "unset";
}

LogObserver::LogObserver() : LogObserver(std::cerr, LogLevel::Info) {}

LogObserver::LogObserver(std::ostream &out, const LogLevel min_level)
    : out_(&out), min_level_(min_level) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (severity(level) < severity(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << to_string(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SpanStartEvent>) {
          log_line(LogLevel::Debug, "span.start name=" + evt.name +
                                        " id=" + std::to_string(evt.span_id) +
                                        format_attributes(evt.attributes));
        } else if constexpr (std::is_same_v<T, SpanEndEvent>) {
          std::string line = "span.end name=" + evt.name + " id=" + std::to_string(evt.span_id) +
                             " status=" + std::string(to_string(evt.status)) +
                             " duration_ms=" + std::to_string(evt.duration.count());
          if (evt.error.has_value()) {
            line += " error=" + *evt.error;
          }
          log_line(evt.status == SpanStatus::Error ? LogLevel::Warn : LogLevel::Info, line);
        } else if constexpr (std::is_same_v<T, LogEvent>) {
          log_line(evt.level, "[" + evt.component + "] " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CounterMetric>) {
          log_line(LogLevel::Debug, "metric." + m.name + " +" + std::to_string(m.value) +
                                        format_attributes(m.labels));
        } else if constexpr (std::is_same_v<T, LatencyMetric>) {
          log_line(LogLevel::Debug,
                   "metric." + m.name + "_ms=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace llmgate::observability
