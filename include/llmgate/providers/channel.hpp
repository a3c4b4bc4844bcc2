#pragma once

#include "llmgate/providers/stream.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace llmgate::providers {

/// Bounded single-producer/single-consumer hand-off for provider events.
/// Pushing a terminal event closes the channel, so a consumer sees at most one.
class EventChannel {
public:
  explicit EventChannel(std::size_t capacity = 64);

  /// Blocks while the channel is full. Returns false once closed or cancelled.
  bool push(ProviderEvent event);
  void close();
  /// Drops buffered events and wakes both sides.
  void cancel();

  /// Blocks until an event is available; nullopt after close or cancel.
  [[nodiscard]] std::optional<ProviderEvent> next();

  [[nodiscard]] bool closed() const;
  [[nodiscard]] bool cancelled() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<ProviderEvent> queue_;
  bool closed_ = false;
  bool cancelled_ = false;
};

class ChannelEventSource final : public IEventSource {
public:
  explicit ChannelEventSource(std::shared_ptr<EventChannel> channel);

  [[nodiscard]] std::optional<ProviderEvent> next() override;

private:
  std::shared_ptr<EventChannel> channel_;
};

} // namespace llmgate::providers
