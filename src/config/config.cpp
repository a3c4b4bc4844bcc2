#include "llmgate/config/config.hpp"

#include "llmgate/common/fs.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace llmgate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".llmgate";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("LLMGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> read_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  const std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

common::Status read_env_u64(const char *name, const std::uint64_t max, std::uint64_t &out) {
  const auto raw = read_env(name);
  if (!raw.has_value()) {
    return common::Status::success();
  }
  std::uint64_t parsed = 0;
  const auto *first = raw->data();
  const auto *last = first + raw->size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last || parsed > max) {
    return common::Status::error(std::string(name) + " must be an integer between 0 and " +
                                 std::to_string(max) + ", got: " + *raw);
  }
  out = parsed;
  return common::Status::success();
}

common::Status read_env_double(const char *name, std::optional<double> &out) {
  const auto raw = read_env(name);
  if (!raw.has_value()) {
    return common::Status::success();
  }
  std::istringstream stream(*raw);
  double parsed = 0.0;
  stream >> parsed;
  if (stream.fail() || !stream.eof()) {
    return common::Status::error(std::string(name) + " must be a number, got: " + *raw);
  }
  out = parsed;
  return common::Status::success();
}

common::Status read_u64(const common::TomlDocument &doc, const std::string &key,
                        const std::uint64_t max, std::uint64_t &out) {
  if (!doc.has(key)) {
    return common::Status::success();
  }
  const auto value = doc.find_u64(key);
  if (!value.has_value() || *value > max) {
    return common::Status::error(key + " must be an integer between 0 and " + std::to_string(max));
  }
  out = *value;
  return common::Status::success();
}

constexpr std::uint64_t U32_LIMIT = std::numeric_limits<std::uint32_t>::max();
constexpr std::uint64_t U64_LIMIT = std::numeric_limits<std::uint64_t>::max();

bool is_known_artifacts_backend(const std::string &backend) {
  return backend == "filesystem" || backend == "sqlite" || backend == "memory" ||
         backend == "none";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::Result<std::filesystem::path>::success(candidate);
    }
    return common::Result<std::filesystem::path>::success(candidate.parent_path());
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<ProviderFallback> parse_chain_entry(const std::string &entry) {
  const std::string trimmed = common::trim(entry);
  if (trimmed.empty()) {
    return common::Result<ProviderFallback>::failure("empty provider chain entry");
  }

  ProviderFallback fallback;
  const auto colon = trimmed.find(':');
  if (colon == std::string::npos) {
    fallback.provider = trimmed;
    return common::Result<ProviderFallback>::success(std::move(fallback));
  }

  fallback.provider = common::trim(trimmed.substr(0, colon));
  const std::string model = common::trim(trimmed.substr(colon + 1));
  if (fallback.provider.empty()) {
    return common::Result<ProviderFallback>::failure("provider chain entry has no provider: " +
                                                     entry);
  }
  if (model.empty()) {
    return common::Result<ProviderFallback>::failure("provider chain entry has empty model: " +
                                                     entry);
  }
  fallback.model = model;
  return common::Result<ProviderFallback>::success(std::move(fallback));
}

common::Status apply_env_overrides(Config &config) {
  auto &gw = config.llm_gateway;
  if (const auto provider = read_env("LLMGATE_DEFAULT_PROVIDER"); provider.has_value()) {
    gw.default_provider = *provider;
  }
  if (const auto model = read_env("LLMGATE_DEFAULT_MODEL"); model.has_value()) {
    gw.default_model = *model;
  }

  std::uint64_t retries = gw.retry_max;
  if (auto status = read_env_u64("LLMGATE_RETRY_MAX", U32_LIMIT, retries); !status.ok()) {
    return status;
  }
  gw.retry_max = static_cast<std::uint32_t>(retries);
  if (auto status = read_env_u64("LLMGATE_RETRY_BACKOFF_BASE_MS", U64_LIMIT, gw.retry_backoff_base_ms);
      !status.ok()) {
    return status;
  }
  if (auto status =
          read_env_u64("LLMGATE_RETRY_BACKOFF_JITTER_MS", U64_LIMIT, gw.retry_backoff_jitter_ms);
      !status.ok()) {
    return status;
  }
  if (read_env("LLMGATE_TOKENS_CAP").has_value()) {
    std::uint64_t cap = 0;
    if (auto status = read_env_u64("LLMGATE_TOKENS_CAP", U64_LIMIT, cap); !status.ok()) {
      return status;
    }
    gw.tokens_cap = cap;
  }
  if (auto status = read_env_double("LLMGATE_COST_CAP_USD", gw.cost_cap_usd); !status.ok()) {
    return status;
  }
  if (const auto root = read_env("LLMGATE_ARTIFACTS_ROOT"); root.has_value()) {
    config.artifacts.root = common::expand_path(*root);
  }
  return common::Status::success();
}

common::Result<Config> config_from_toml(const common::TomlDocument &doc) {
  Config config;
  auto &gw = config.llm_gateway;

  gw.default_provider = doc.get_string("llm_gateway.default_provider", gw.default_provider);
  gw.default_model = doc.get_string("llm_gateway.default_model", gw.default_model);
  std::uint64_t retries = gw.retry_max;
  if (auto status = read_u64(doc, "llm_gateway.retry_max", U32_LIMIT, retries); !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }
  gw.retry_max = static_cast<std::uint32_t>(retries);
  if (auto status =
          read_u64(doc, "llm_gateway.retry_backoff_base_ms", U64_LIMIT, gw.retry_backoff_base_ms);
      !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }
  if (auto status = read_u64(doc, "llm_gateway.retry_backoff_jitter_ms", U64_LIMIT,
                             gw.retry_backoff_jitter_ms);
      !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }
  if (doc.has("llm_gateway.tokens_cap")) {
    const auto cap = doc.find_u64("llm_gateway.tokens_cap");
    if (!cap.has_value()) {
      return common::Result<Config>::failure("llm_gateway.tokens_cap must be a non-negative integer");
    }
    gw.tokens_cap = cap;
  }
  if (doc.has("llm_gateway.cost_cap_usd")) {
    const auto cost = doc.find_double("llm_gateway.cost_cap_usd");
    if (!cost.has_value()) {
      return common::Result<Config>::failure("llm_gateway.cost_cap_usd must be a number");
    }
    gw.cost_cap_usd = cost;
  }
  for (const auto &entry : doc.get_string_array("llm_gateway.provider_chain")) {
    auto parsed = parse_chain_entry(entry);
    if (!parsed.ok()) {
      return common::Result<Config>::failure("llm_gateway.provider_chain: " + parsed.error());
    }
    gw.provider_chain.push_back(std::move(parsed.value()));
  }

  for (const auto &name : doc.subsections("providers")) {
    ProviderConfig provider;
    provider.default_model = doc.get_string("providers." + name + ".default_model");
    config.providers[common::to_lower(name)] = std::move(provider);
  }

  config.artifacts.enabled = doc.get_bool("artifacts.enabled", config.artifacts.enabled);
  config.artifacts.backend =
      common::to_lower(doc.get_string("artifacts.backend", config.artifacts.backend));
  config.artifacts.root = common::expand_path(doc.get_string("artifacts.root", config.artifacts.root));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  std::uint64_t queue_size = config.events.max_queue_size;
  if (auto status = read_u64(doc, "events.max_queue_size", std::numeric_limits<std::size_t>::max(),
                             queue_size);
      !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }
  config.events.max_queue_size = static_cast<std::size_t>(queue_size);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config_from_string(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  auto config = config_from_toml(parsed.value());
  if (!config.ok()) {
    return config;
  }
  if (auto status = apply_env_overrides(config.value()); !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }
  return config;
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    if (auto status = apply_env_overrides(config); !status.ok()) {
      return common::Result<Config>::failure(status.error());
    }
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_config_from_string(buffer.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto &gw = config.llm_gateway;

  if (common::trim(gw.default_provider).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "llm_gateway.default_provider must not be empty");
  }

  if (gw.tokens_cap.has_value() && *gw.tokens_cap == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "llm_gateway.tokens_cap must be > 0 when set");
  }

  if (gw.cost_cap_usd.has_value() && (!std::isfinite(*gw.cost_cap_usd) || *gw.cost_cap_usd < 0.0)) {
    return common::Result<std::vector<std::string>>::failure(
        "llm_gateway.cost_cap_usd must be a non-negative number");
  }

  for (const auto &entry : gw.provider_chain) {
    if (common::trim(entry.provider).empty()) {
      return common::Result<std::vector<std::string>>::failure(
          "llm_gateway.provider_chain contains an entry without provider");
    }
    if (entry.model.has_value() && common::trim(*entry.model).empty()) {
      return common::Result<std::vector<std::string>>::failure(
          "llm_gateway.provider_chain entry for " + entry.provider + " has an empty model");
    }
  }

  const std::string artifacts_backend = common::to_lower(common::trim(config.artifacts.backend));
  if (!is_known_artifacts_backend(artifacts_backend)) {
    return common::Result<std::vector<std::string>>::failure("Invalid artifacts.backend: " +
                                                              config.artifacts.backend);
  }

  if (config.events.max_queue_size == 0) {
    return common::Result<std::vector<std::string>>::failure("events.max_queue_size must be > 0");
  }

  if (gw.retry_max > 10) {
    warnings.push_back("llm_gateway.retry_max above 10 multiplies provider load on outages");
  }
  if (gw.default_model.empty() && !config.providers.contains(common::to_lower(gw.default_provider))) {
    warnings.push_back("no default model configured for provider " + gw.default_provider);
  }
  if (!config.artifacts.enabled || artifacts_backend == "none") {
    warnings.push_back("request audit persistence is disabled");
  }
  if (artifacts_backend == "memory") {
    warnings.push_back("artifacts.backend=memory keeps audit records only for the process lifetime");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace llmgate::config
