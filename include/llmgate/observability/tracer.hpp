#pragma once

#include "llmgate/observability/observer.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <type_traits>

namespace llmgate::observability {

class Tracer;

/// A timed unit of work. Emits SpanStartEvent on creation and exactly one SpanEndEvent,
/// either from end() or from the destructor.
class Span {
public:
  Span() = default;
  ~Span();

  Span(const Span &) = delete;
  Span &operator=(const Span &) = delete;
  Span(Span &&other) noexcept;
  Span &operator=(Span &&other) noexcept;

  template <typename T> void set_attribute(const std::string &key, const T &value) {
    if constexpr (std::is_same_v<T, bool>) {
      attributes_[key] = value ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
      attributes_[key] = std::to_string(value);
    } else {
      attributes_[key] = std::string(value);
    }
  }

  void record_error(const std::string &message);
  void set_status(SpanStatus status) { status_ = status; }
  void end();

  [[nodiscard]] std::uint64_t id() const { return id_; }
  [[nodiscard]] bool active() const { return observer_ != nullptr && !ended_; }
  [[nodiscard]] const Attributes &attributes() const { return attributes_; }
  [[nodiscard]] SpanStatus status() const { return status_; }

private:
  friend class Tracer;
  Span(std::shared_ptr<IObserver> observer, std::uint64_t id, std::string name,
       Attributes attributes);

  std::shared_ptr<IObserver> observer_;
  std::uint64_t id_ = 0;
  std::string name_;
  Attributes attributes_;
  SpanStatus status_ = SpanStatus::Unset;
  std::optional<std::string> error_;
  std::chrono::steady_clock::time_point started_at_{};
  bool ended_ = false;
};

class Tracer {
public:
  explicit Tracer(std::shared_ptr<IObserver> observer);

  [[nodiscard]] Span start_span(std::string name, Attributes attributes = {},
                                const Span *parent = nullptr);

private:
  std::shared_ptr<IObserver> observer_;
  std::atomic<std::uint64_t> next_id_{1};
};

} // namespace llmgate::observability
