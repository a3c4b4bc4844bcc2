#include "llmgate/cli/commands.hpp"

#include "llmgate/audit/factory.hpp"
#include "llmgate/common/fs.hpp"
#include "llmgate/config/config.hpp"
#include "llmgate/events/event.hpp"
#include "llmgate/gateway/gateway.hpp"
#include "llmgate/observability/factory.hpp"
#include "llmgate/providers/chain.hpp"
#include "llmgate/providers/echo.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace llmgate::cli {

namespace {

std::atomic<gateway::CancelToken *> g_active_cancel{nullptr};
static_assert(std::atomic<gateway::CancelToken *>::is_always_lock_free);

void handle_interrupt(int) {
  if (auto *cancel = g_active_cancel.load(); cancel != nullptr) {
    cancel->cancel();
  }
}

std::string version_string() {
#ifdef LLMGATE_VERSION
  std::string version = LLMGATE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "llmgate " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || args[i] == short_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string random_id(const std::string &prefix) {
  static std::mt19937_64 rng{std::random_device{}()};
  std::ostringstream out;
  out << prefix << std::hex << rng();
  return out.str();
}

int run_chain(const std::vector<std::string> &args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  std::optional<std::string> hint;
  if (!args.empty()) {
    hint = args[0];
  }
  auto chain = providers::resolve_provider_chain(hint, cfg.value());
  if (!chain.ok()) {
    std::cerr << chain.error().to_string() << "\n";
    return 1;
  }
  for (const auto &handle : chain.value()) {
    std::cout << handle.chain_index << "  " << handle.label() << "\n";
  }
  return 0;
}

void print_config(const config::Config &cfg) {
  const auto &gw = cfg.llm_gateway;
  std::cout << "default_provider       = " << gw.default_provider << "\n";
  std::cout << "default_model          = " << gw.default_model << "\n";
  std::cout << "retry_max              = " << gw.retry_max << "\n";
  std::cout << "retry_backoff_base_ms  = " << gw.retry_backoff_base_ms << "\n";
  std::cout << "retry_backoff_jitter_ms= " << gw.retry_backoff_jitter_ms << "\n";
  std::cout << "tokens_cap             = "
            << (gw.tokens_cap.has_value() ? std::to_string(*gw.tokens_cap) : "(none)") << "\n";
  std::cout << "cost_cap_usd           = "
            << (gw.cost_cap_usd.has_value() ? std::to_string(*gw.cost_cap_usd) : "(none)")
            << "\n";
  std::cout << "provider_chain         =";
  for (const auto &entry : gw.provider_chain) {
    std::cout << ' ' << entry.provider;
    if (entry.model.has_value()) {
      std::cout << ':' << *entry.model;
    }
  }
  std::cout << "\n";
  for (const auto &[name, provider] : cfg.providers) {
    std::cout << "providers." << name << ".default_model = " << provider.default_model << "\n";
  }
  std::cout << "artifacts              = " << (cfg.artifacts.enabled ? cfg.artifacts.backend : "off")
            << " (" << cfg.artifacts.root << ")\n";
  std::cout << "observability.backend  = " << cfg.observability.backend << "\n";
  std::cout << "events.max_queue_size  = " << cfg.events.max_queue_size << "\n";
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    print_config(cfg.value());
    return 0;
  }

  if (args[0] == "validate") {
    auto validation = config::validate_config(cfg.value());
    if (!validation.ok()) {
      std::cerr << "error: " << validation.error() << "\n";
      return 1;
    }
    for (const auto &warning : validation.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "config ok\n";
    return 0;
  }

  std::cerr << "unknown config command: " << args[0] << "\n";
  return 1;
}

int run_call(std::vector<std::string> args) {
  providers::CallParameters params;
  std::string value;
  if (take_option(args, "--provider", "-p", value)) {
    params.provider = value;
  }
  if (take_option(args, "--model", "-m", value)) {
    params.model = value;
  }
  if (take_option(args, "--max-tokens", "-n", value)) {
    std::uint64_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
      std::cerr << "invalid --max-tokens: " << value << "\n";
      return 1;
    }
    params.max_tokens = parsed;
  }
  if (take_option(args, "--system", "-s", value)) {
    params.extra["system"] = value;
  }
  std::string run_id = random_id("run-");
  if (take_option(args, "--run-id", "", value)) {
    run_id = value;
  }

  const std::string prompt = join_tokens(args);
  if (prompt.empty()) {
    std::cerr << "usage: llmgate run [--provider P] [--model M] [--max-tokens N] <prompt>\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto validation = config::validate_config(cfg.value());
  if (!validation.ok()) {
    std::cerr << "invalid config: " << validation.error() << "\n";
    return 1;
  }

  auto store = audit::create_artifact_store(cfg.value());
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }

  gateway::GatewayDependencies deps;
  deps.telemetry = observability::Telemetry::create(observability::create_observer(cfg.value()));
  deps.artifacts = store.value();
  deps.events = std::make_shared<events::CallbackEventSink>(
      [](const events::LlmEvent &event) { std::cout << event.serialize() << "\n" << std::flush; });

  gateway::LlmGateway llm(cfg.value(), std::move(deps));
  llm.register_adapter("echo", std::make_shared<providers::EchoStreamAdapter>());

  gateway::CancelToken cancel;
  g_active_cancel.store(&cancel);
  const auto previous = std::signal(SIGINT, handle_interrupt);

  const auto result =
      llm.run(run_id, random_id("trace-"), prompt, params, std::nullopt, cancel);

  std::signal(SIGINT, previous);
  g_active_cancel.store(nullptr);
  llm.telemetry().observer->flush();

  if (!result.ok()) {
    std::cerr << result.error().to_string() << "\n";
    return 1;
  }
  std::cout << result.value().to_json().dump_pretty(2) << "\n";
  return 0;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  llmgate [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  run [--provider P] [--model M] [--max-tokens N] [--system TEXT] <prompt>\n";
  std::cout << "                     Run one call through the gateway (the `echo` provider\n";
  std::cout << "                     is built in) and print every event as a JSON line\n";
  std::cout << "  chain [hint]       Show the provider chain resolved for a hint\n";
  std::cout << "  config show        Display the effective gateway configuration\n";
  std::cout << "  config validate    Check the configuration for errors and warnings\n";
  std::cout << "  config path        Print the configuration file location\n";
  std::cout << "  version            Show version\n";
  std::cout << "  help               Show this help\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "chain") {
    return run_chain(args);
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "run") {
    return run_call(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace llmgate::cli
