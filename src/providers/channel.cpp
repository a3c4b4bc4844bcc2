#include "llmgate/providers/channel.hpp"

namespace llmgate::providers {

EventChannel::EventChannel(const std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool EventChannel::push(ProviderEvent event) {
  std::unique_lock<std::mutex> lock(mutex_);
  not_full_.wait(lock, [this] { return closed_ || cancelled_ || queue_.size() < capacity_; });
  if (closed_ || cancelled_) {
    return false;
  }
  const bool terminal = is_terminal(event);
  queue_.push_back(std::move(event));
  if (terminal) {
    closed_ = true;
  }
  lock.unlock();
  not_empty_.notify_one();
  if (terminal) {
    not_full_.notify_all();
  }
  return true;
}

void EventChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

void EventChannel::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    closed_ = true;
    queue_.clear();
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::optional<ProviderEvent> EventChannel::next() {
  std::unique_lock<std::mutex> lock(mutex_);
  not_empty_.wait(lock, [this] { return !queue_.empty() || closed_ || cancelled_; });
  if (queue_.empty()) {
    return std::nullopt;
  }
  ProviderEvent event = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return event;
}

bool EventChannel::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

bool EventChannel::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

ChannelEventSource::ChannelEventSource(std::shared_ptr<EventChannel> channel)
    : channel_(std::move(channel)) {}

std::optional<ProviderEvent> ChannelEventSource::next() {
  if (channel_ == nullptr) {
    return std::nullopt;
  }
  return channel_->next();
}

} // namespace llmgate::providers
