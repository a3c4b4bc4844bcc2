#include "llmgate/observability/tracer.hpp"

namespace llmgate::observability {

Span::Span(std::shared_ptr<IObserver> observer, const std::uint64_t id, std::string name,
           Attributes attributes)
    : observer_(std::move(observer)), id_(id), name_(std::move(name)),
      attributes_(std::move(attributes)), started_at_(std::chrono::steady_clock::now()) {}

Span::~Span() { end(); }

Span::Span(Span &&other) noexcept
    : observer_(std::move(other.observer_)), id_(other.id_), name_(std::move(other.name_)),
      attributes_(std::move(other.attributes_)), status_(other.status_),
      error_(std::move(other.error_)), started_at_(other.started_at_), ended_(other.ended_) {
  other.observer_.reset();
  other.ended_ = true;
}

Span &Span::operator=(Span &&other) noexcept {
  if (this != &other) {
    end();
    observer_ = std::move(other.observer_);
    id_ = other.id_;
    name_ = std::move(other.name_);
    attributes_ = std::move(other.attributes_);
    status_ = other.status_;
    error_ = std::move(other.error_);
    started_at_ = other.started_at_;
    ended_ = other.ended_;
    other.observer_.reset();
    other.ended_ = true;
  }
  return *this;
}

void Span::record_error(const std::string &message) {
  error_ = message;
  status_ = SpanStatus::Error;
}

void Span::end() {
  if (ended_ || observer_ == nullptr) {
    ended_ = true;
    return;
  }
  ended_ = true;
  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started_at_);
  observer_->record_event(SpanEndEvent{.span_id = id_,
                                       .name = name_,
                                       .status = status_,
                                       .duration = duration,
                                       .attributes = attributes_,
                                       .error = error_});
}

Tracer::Tracer(std::shared_ptr<IObserver> observer) : observer_(std::move(observer)) {}

Span Tracer::start_span(std::string name, Attributes attributes, const Span *parent) {
  const std::uint64_t id = next_id_.fetch_add(1);
  std::optional<std::uint64_t> parent_id;
  if (parent != nullptr && parent->id() != 0) {
    parent_id = parent->id();
  }
  if (observer_ != nullptr) {
    observer_->record_event(SpanStartEvent{
        .span_id = id, .parent_id = parent_id, .name = name, .attributes = attributes});
  }
  return Span(observer_, id, std::move(name), std::move(attributes));
}

} // namespace llmgate::observability
