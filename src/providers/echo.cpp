#include "llmgate/providers/echo.hpp"

#include "llmgate/common/fs.hpp"
#include "llmgate/providers/channel.hpp"

#include <thread>

namespace llmgate::providers {

namespace {

/// Owns the producer thread; destroying the source stops and joins it.
class ProducerEventSource final : public IEventSource {
public:
  ProducerEventSource(std::shared_ptr<EventChannel> channel, std::thread producer)
      : channel_(std::move(channel)), producer_(std::move(producer)) {}

  ~ProducerEventSource() override {
    channel_->cancel();
    if (producer_.joinable()) {
      producer_.join();
    }
  }

  ProducerEventSource(const ProducerEventSource &) = delete;
  ProducerEventSource &operator=(const ProducerEventSource &) = delete;

  [[nodiscard]] std::optional<ProviderEvent> next() override { return channel_->next(); }

private:
  std::shared_ptr<EventChannel> channel_;
  std::thread producer_;
};

} // namespace

EchoStreamAdapter::EchoStreamAdapter() : EchoStreamAdapter(Options{}) {}

EchoStreamAdapter::EchoStreamAdapter(Options options) : options_(options) {}

common::Result<ProviderStream, gateway::GatewayError>
EchoStreamAdapter::open_stream(const std::string &prompt, const CallParameters &params,
                               const ProviderHandle &handle, const CallMetadata &metadata) {
  (void)params;
  (void)handle;
  (void)metadata;

  std::vector<std::string> words = common::split_whitespace(prompt);
  auto channel = std::make_shared<EventChannel>(options_.channel_capacity);

  const Options options = options_;
  std::thread producer([channel, words, options]() {
    double cost = 0.0;
    for (std::size_t i = 0; i < words.size(); ++i) {
      TokenEvent token;
      token.delta = i == 0 ? words[i] : " " + words[i];
      if (options.cost_per_token_usd.has_value()) {
        cost += *options.cost_per_token_usd;
        token.usage.cost_usd = cost;
      }
      if (!channel->push(std::move(token))) {
        return;
      }
      if (options.token_delay.count() > 0) {
        std::this_thread::sleep_for(options.token_delay);
      }
    }
    CompleteEvent complete;
    complete.finish_reason = "stop";
    complete.usage.prompt_tokens = words.size();
    complete.usage.completion_tokens = words.size();
    if (options.cost_per_token_usd.has_value()) {
      complete.usage.cost_usd = cost;
    }
    (void)channel->push(std::move(complete));
  });

  ProviderStream stream;
  stream.events = std::make_unique<ProducerEventSource>(channel, std::move(producer));
  stream.cancel = [channel]() { channel->cancel(); };
  if (!words.empty()) {
    stream.usage.prompt_tokens = words.size();
  }
  return common::Result<ProviderStream, gateway::GatewayError>::success(std::move(stream));
}

} // namespace llmgate::providers
