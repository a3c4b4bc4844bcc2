#pragma once

#include "llmgate/common/result.hpp"
#include "llmgate/common/toml.hpp"
#include "llmgate/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace llmgate::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_from_string(const std::string &content);
[[nodiscard]] common::Result<Config> config_from_toml(const common::TomlDocument &doc);

/// Parses `provider` or `provider:model` chain entries.
[[nodiscard]] common::Result<ProviderFallback> parse_chain_entry(const std::string &entry);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// Fails on a numeric variable that does not parse or is out of range.
[[nodiscard]] common::Status apply_env_overrides(Config &config);

} // namespace llmgate::config
