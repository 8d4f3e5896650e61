#pragma once

#include "shellguard/common/result.hpp"
#include "shellguard/common/toml.hpp"
#include "shellguard/config/schema.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shellguard::config {

using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;
using Assignment = std::pair<std::string, std::string>;

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> default_config_path();
/// Path named by SHELLGUARD_CONFIG, if set.
[[nodiscard]] std::optional<std::filesystem::path> env_config_path();
/// Path given with --config.
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();
/// File layer that runtime updates persist to: --config, else SHELLGUARD_CONFIG,
/// else the default file.
[[nodiscard]] common::Result<std::filesystem::path> config_path();

/// Scalars replace, lists union (lower layer order first, duplicates dropped).
void apply_overlay(Config &config, const ConfigOverlay &overlay);

[[nodiscard]] common::Result<ConfigOverlay> overlay_from_toml(const common::TomlDocument &doc);
[[nodiscard]] common::Result<ConfigOverlay> load_overlay_file(const std::filesystem::path &path);
[[nodiscard]] common::Result<ConfigOverlay> overlay_from_env(const EnvLookup &lookup);
[[nodiscard]] common::Result<ConfigOverlay>
overlay_from_assignments(const std::vector<Assignment> &assignments);

[[nodiscard]] EnvLookup process_env_lookup();
[[nodiscard]] std::unordered_map<std::string, std::string>
read_dotenv_file(const std::filesystem::path &path);
[[nodiscard]] common::Result<ConfigOverlay> load_dotenv_overlay();

/// default < SHELLGUARD_CONFIG file < --config file < .env < environment.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);
[[nodiscard]] common::Status save_config_to(const Config &config, const std::filesystem::path &path);
[[nodiscard]] std::string render_config_toml(const Config &config);

/// Failure for unusable settings, warnings for suspicious ones.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);
/// validate_config without compiling the dangerous patterns.
[[nodiscard]] common::Result<std::vector<std::string>> validate_settings(const Config &config);

[[nodiscard]] std::vector<std::string> config_keys();
[[nodiscard]] common::Result<std::string> get_config_value(const Config &config,
                                                           const std::string &key);

} // namespace shellguard::config
