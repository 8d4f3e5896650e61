#include "shellguard/config/config.hpp"

#include "shellguard/common/fs.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <type_traits>
#include <unordered_set>
#include <variant>

namespace shellguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".shellguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

using StringField = std::optional<std::string> ConfigOverlay::*;
using BoolField = std::optional<bool> ConfigOverlay::*;
using U64Field = std::optional<std::uint64_t> ConfigOverlay::*;
using ListField = std::vector<std::string> ConfigOverlay::*;
using Field = std::variant<StringField, BoolField, U64Field, ListField>;

struct KeyBinding {
  const char *key;
  const char *env_name;
  Field field;
};

const std::array<KeyBinding, 23> &key_bindings() {
  static const std::array<KeyBinding, 23> bindings = {{
      {"server.name", nullptr, &ConfigOverlay::server_name},
      {"server.version", nullptr, &ConfigOverlay::server_version},
      {"server.description", nullptr, &ConfigOverlay::server_description},
      {"server.log_level", "SHELLGUARD_LOG_LEVEL", &ConfigOverlay::log_level},
      {"server.log_backend", "SHELLGUARD_LOG_BACKEND", &ConfigOverlay::log_backend},
      {"security.session_timeout", "SHELLGUARD_SESSION_TIMEOUT",
       &ConfigOverlay::session_timeout_secs},
      {"security.command_timeout", "SHELLGUARD_COMMAND_TIMEOUT",
       &ConfigOverlay::command_timeout_secs},
      {"security.max_output_size", "SHELLGUARD_MAX_OUTPUT_SIZE", &ConfigOverlay::max_output_size},
      {"security.max_command_length", "SHELLGUARD_MAX_COMMAND_LENGTH",
       &ConfigOverlay::max_command_length},
      {"security.allow_user_confirmation", "SHELLGUARD_ALLOW_USER_CONFIRMATION",
       &ConfigOverlay::allow_user_confirmation},
      {"security.require_session_id", "SHELLGUARD_REQUIRE_SESSION_ID",
       &ConfigOverlay::require_session_id},
      {"security.allow_command_separators", "SHELLGUARD_ALLOW_COMMAND_SEPARATORS",
       &ConfigOverlay::allow_command_separators},
      {"security.allow_pipe", "SHELLGUARD_ALLOW_PIPE", &ConfigOverlay::allow_pipe},
      {"security.allow_sequence", "SHELLGUARD_ALLOW_SEQUENCE", &ConfigOverlay::allow_sequence},
      {"security.allow_background", "SHELLGUARD_ALLOW_BACKGROUND",
       &ConfigOverlay::allow_background},
      {"security.allow_unrecognized_commands", "SHELLGUARD_ALLOW_UNRECOGNIZED_COMMANDS",
       &ConfigOverlay::allow_unrecognized_commands},
      {"commands.read", "SHELLGUARD_READ_COMMANDS", &ConfigOverlay::read_commands},
      {"commands.write", "SHELLGUARD_WRITE_COMMANDS", &ConfigOverlay::write_commands},
      {"commands.system", "SHELLGUARD_SYSTEM_COMMANDS", &ConfigOverlay::system_commands},
      {"commands.blocked", "SHELLGUARD_BLOCKED_COMMANDS", &ConfigOverlay::blocked_commands},
      {"commands.dangerous_patterns", nullptr, &ConfigOverlay::dangerous_patterns},
      {"output.max_size", "SHELLGUARD_OUTPUT_MAX_SIZE", &ConfigOverlay::output_max_size},
      {"output.format", "SHELLGUARD_OUTPUT_FORMAT", &ConfigOverlay::output_format},
  }};
  return bindings;
}

const KeyBinding *find_binding(const std::string &key) {
  for (const auto &binding : key_bindings()) {
    if (key == binding.key) {
      return &binding;
    }
  }
  return nullptr;
}

template <class> inline constexpr bool always_false_v = false;

// Text form used by env vars, .env files and runtime assignments.
common::Status assign_from_text(ConfigOverlay &overlay, const KeyBinding &binding,
                                const std::string &text) {
  return std::visit(
      [&](const auto field) -> common::Status {
        using F = std::decay_t<decltype(field)>;
        if constexpr (std::is_same_v<F, StringField>) {
          overlay.*field = common::trim(text);
        } else if constexpr (std::is_same_v<F, BoolField>) {
          auto parsed = common::parse_bool(text);
          if (!parsed.ok()) {
            return common::Status::error(common::ErrorCode::ConfigurationError,
                                         std::string(binding.key) + ": " + parsed.error());
          }
          overlay.*field = parsed.value();
        } else if constexpr (std::is_same_v<F, U64Field>) {
          auto parsed = common::parse_u64(text);
          if (!parsed.ok()) {
            return common::Status::error(common::ErrorCode::ConfigurationError,
                                         std::string(binding.key) + ": " + parsed.error());
          }
          overlay.*field = parsed.value();
        } else if constexpr (std::is_same_v<F, ListField>) {
          for (auto &item : common::split_list(text)) {
            (overlay.*field).push_back(std::move(item));
          }
        } else {
          static_assert(always_false_v<F>, "unhandled field kind");
        }
        return common::Status::success();
      },
      binding.field);
}

common::Status assign_from_toml(ConfigOverlay &overlay, const KeyBinding &binding,
                                const common::TomlDocument &doc) {
  const std::string key = binding.key;
  return std::visit(
      [&](const auto field) -> common::Status {
        using F = std::decay_t<decltype(field)>;
        if constexpr (std::is_same_v<F, StringField>) {
          auto value = doc.get_string(key);
          if (!value.ok()) {
            return value.status();
          }
          overlay.*field = value.value();
        } else if constexpr (std::is_same_v<F, BoolField>) {
          auto value = doc.get_bool(key);
          if (!value.ok()) {
            return value.status();
          }
          overlay.*field = value.value();
        } else if constexpr (std::is_same_v<F, U64Field>) {
          auto value = doc.get_u64(key);
          if (!value.ok()) {
            return value.status();
          }
          overlay.*field = value.value();
        } else if constexpr (std::is_same_v<F, ListField>) {
          auto value = doc.get_string_array(key);
          if (!value.ok()) {
            return value.status();
          }
          overlay.*field = value.value();
        } else {
          static_assert(always_false_v<F>, "unhandled field kind");
        }
        return common::Status::success();
      },
      binding.field);
}

ConfigOverlay overlay_from_config(const Config &config) {
  ConfigOverlay overlay;
  overlay.server_name = config.server.name;
  overlay.server_version = config.server.version;
  overlay.server_description = config.server.description;
  overlay.log_level = config.server.log_level;
  overlay.log_backend = config.server.log_backend;
  overlay.session_timeout_secs = config.security.session_timeout_secs;
  overlay.command_timeout_secs = config.security.command_timeout_secs;
  overlay.max_output_size = config.security.max_output_size;
  overlay.max_command_length = config.security.max_command_length;
  overlay.allow_user_confirmation = config.security.allow_user_confirmation;
  overlay.require_session_id = config.security.require_session_id;
  overlay.allow_command_separators = config.security.allow_command_separators;
  overlay.allow_pipe = config.security.allow_pipe;
  overlay.allow_sequence = config.security.allow_sequence;
  overlay.allow_background = config.security.allow_background;
  overlay.allow_unrecognized_commands = config.security.allow_unrecognized_commands;
  overlay.read_commands = config.commands.read_commands;
  overlay.write_commands = config.commands.write_commands;
  overlay.system_commands = config.commands.system_commands;
  overlay.blocked_commands = config.commands.blocked_commands;
  overlay.dangerous_patterns = config.commands.dangerous_patterns;
  overlay.output_max_size = config.output.max_size;
  overlay.output_format = config.output.format;
  return overlay;
}

std::string render_value(const ConfigOverlay &overlay, const KeyBinding &binding) {
  return std::visit(
      [&](const auto field) -> std::string {
        using F = std::decay_t<decltype(field)>;
        if constexpr (std::is_same_v<F, StringField>) {
          return (overlay.*field).value_or("");
        } else if constexpr (std::is_same_v<F, BoolField>) {
          return (overlay.*field).value_or(false) ? "true" : "false";
        } else if constexpr (std::is_same_v<F, U64Field>) {
          return std::to_string((overlay.*field).value_or(0));
        } else if constexpr (std::is_same_v<F, ListField>) {
          return common::join(overlay.*field, ",");
        } else {
          static_assert(always_false_v<F>, "unhandled field kind");
        }
      },
      binding.field);
}

void union_into(std::vector<std::string> &base, const std::vector<std::string> &extra) {
  for (const auto &item : extra) {
    if (std::find(base.begin(), base.end(), item) == base.end()) {
      base.push_back(item);
    }
  }
}

template <typename T> void replace_if_set(T &target, const std::optional<T> &value) {
  if (value.has_value()) {
    target = *value;
  }
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::optional<std::filesystem::path> non_empty_env_path(const char *name) {
  if (const char *env = std::getenv(name); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

common::Status apply_file_layer(Config &config, const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Status::success();
  }
  auto overlay = load_overlay_file(path);
  if (!overlay.ok()) {
    return overlay.status();
  }
  apply_overlay(config, overlay.value());
  return common::Status::success();
}

bool is_known_log_level(const std::string &level) {
  static const std::unordered_set<std::string> known = {"debug", "info", "warn", "warning",
                                                        "error"};
  return known.contains(common::to_lower(level));
}

void warn_overlaps(const std::string &left_name, const std::vector<std::string> &left,
                   const std::string &right_name, const std::vector<std::string> &right,
                   std::vector<std::string> &warnings) {
  for (const auto &name : left) {
    if (std::find(right.begin(), right.end(), name) != right.end()) {
      warnings.push_back("'" + name + "' is listed as both " + left_name + " and " + right_name);
    }
  }
}

common::Status check_names(const std::string &list_name, const std::vector<std::string> &names) {
  for (const auto &name : names) {
    if (name.empty() || name.find_first_of(" \t\r\n") != std::string::npos) {
      return common::Status::error(common::ErrorCode::ConfigurationError,
                                   "commands." + list_name + ": invalid command name '" + name +
                                       "'");
    }
  }
  return common::Status::success();
}

} // namespace

bool ConfigOverlay::empty() const {
  return !server_name && !server_version && !server_description && !log_level && !log_backend &&
         !session_timeout_secs && !command_timeout_secs && !max_output_size && !max_command_length &&
         !allow_user_confirmation && !require_session_id && !allow_command_separators &&
         !allow_pipe && !allow_sequence && !allow_background && !allow_unrecognized_commands &&
         read_commands.empty() && write_commands.empty() && system_commands.empty() &&
         blocked_commands.empty() && dangerous_patterns.empty() && !output_max_size &&
         !output_format;
}

common::Result<std::filesystem::path> config_dir() {
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> default_config_path() {
  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

std::optional<std::filesystem::path> env_config_path() {
  return non_empty_env_path("SHELLGUARD_CONFIG");
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

common::Result<std::filesystem::path> config_path() {
  if (g_config_path_override.has_value()) {
    return common::Result<std::filesystem::path>::success(*g_config_path_override);
  }
  if (auto env_path = env_config_path(); env_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*env_path);
  }
  return default_config_path();
}

void apply_overlay(Config &config, const ConfigOverlay &overlay) {
  replace_if_set(config.server.name, overlay.server_name);
  replace_if_set(config.server.version, overlay.server_version);
  replace_if_set(config.server.description, overlay.server_description);
  replace_if_set(config.server.log_level, overlay.log_level);
  replace_if_set(config.server.log_backend, overlay.log_backend);

  replace_if_set(config.security.session_timeout_secs, overlay.session_timeout_secs);
  replace_if_set(config.security.command_timeout_secs, overlay.command_timeout_secs);
  replace_if_set(config.security.max_output_size, overlay.max_output_size);
  replace_if_set(config.security.max_command_length, overlay.max_command_length);
  replace_if_set(config.security.allow_user_confirmation, overlay.allow_user_confirmation);
  replace_if_set(config.security.require_session_id, overlay.require_session_id);
  replace_if_set(config.security.allow_command_separators, overlay.allow_command_separators);
  replace_if_set(config.security.allow_pipe, overlay.allow_pipe);
  replace_if_set(config.security.allow_sequence, overlay.allow_sequence);
  replace_if_set(config.security.allow_background, overlay.allow_background);
  replace_if_set(config.security.allow_unrecognized_commands,
                 overlay.allow_unrecognized_commands);

  union_into(config.commands.read_commands, overlay.read_commands);
  union_into(config.commands.write_commands, overlay.write_commands);
  union_into(config.commands.system_commands, overlay.system_commands);
  union_into(config.commands.blocked_commands, overlay.blocked_commands);
  union_into(config.commands.dangerous_patterns, overlay.dangerous_patterns);

  replace_if_set(config.output.max_size, overlay.output_max_size);
  replace_if_set(config.output.format, overlay.output_format);
}

common::Result<ConfigOverlay> overlay_from_toml(const common::TomlDocument &doc) {
  ConfigOverlay overlay;
  for (const auto &key : doc.keys()) {
    const KeyBinding *binding = find_binding(key);
    if (binding == nullptr) {
      return common::Result<ConfigOverlay>::failure(common::ErrorCode::ConfigurationError,
                                                    "unknown configuration key: " + key);
    }
    if (auto status = assign_from_toml(overlay, *binding, doc); !status.ok()) {
      return common::Result<ConfigOverlay>::failure(status);
    }
  }
  return common::Result<ConfigOverlay>::success(std::move(overlay));
}

common::Result<ConfigOverlay> load_overlay_file(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<ConfigOverlay>::failure(content.status());
  }
  auto doc = common::parse_toml(content.value());
  if (!doc.ok()) {
    return common::Result<ConfigOverlay>::failure(common::ErrorCode::ConfigurationError,
                                                  path.string() + ": " + doc.error());
  }
  auto overlay = overlay_from_toml(doc.value());
  if (!overlay.ok()) {
    return common::Result<ConfigOverlay>::failure(common::ErrorCode::ConfigurationError,
                                                  path.string() + ": " + overlay.error());
  }
  return overlay;
}

common::Result<ConfigOverlay> overlay_from_env(const EnvLookup &lookup) {
  ConfigOverlay overlay;
  for (const auto &binding : key_bindings()) {
    if (binding.env_name == nullptr) {
      continue;
    }
    const auto value = lookup(binding.env_name);
    if (!value.has_value() || common::trim(*value).empty()) {
      continue;
    }
    if (auto status = assign_from_text(overlay, binding, *value); !status.ok()) {
      return common::Result<ConfigOverlay>::failure(
          common::ErrorCode::ConfigurationError,
          std::string(binding.env_name) + ": " + status.error());
    }
  }
  return common::Result<ConfigOverlay>::success(std::move(overlay));
}

common::Result<ConfigOverlay> overlay_from_assignments(const std::vector<Assignment> &assignments) {
  ConfigOverlay overlay;
  for (const auto &[key, value] : assignments) {
    const KeyBinding *binding = find_binding(common::trim(key));
    if (binding == nullptr) {
      return common::Result<ConfigOverlay>::failure(common::ErrorCode::ConfigurationError,
                                                    "unknown configuration key: " + key);
    }
    if (auto status = assign_from_text(overlay, *binding, value); !status.ok()) {
      return common::Result<ConfigOverlay>::failure(status);
    }
  }
  return common::Result<ConfigOverlay>::success(std::move(overlay));
}

EnvLookup process_env_lookup() {
  return [](const std::string &name) -> std::optional<std::string> {
    if (const char *value = std::getenv(name.c_str()); value != nullptr) {
      return std::string(value);
    }
    return std::nullopt;
  };
}

std::unordered_map<std::string, std::string> read_dotenv_file(const std::filesystem::path &path) {
  std::unordered_map<std::string, std::string> values;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return values;
  }

  std::ifstream file(path);
  if (!file) {
    return values;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    values.emplace(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
  return values;
}

common::Result<ConfigOverlay> load_dotenv_overlay() {
  std::vector<std::filesystem::path> candidates;
  if (auto env_file = non_empty_env_path("SHELLGUARD_ENV_FILE"); env_file.has_value()) {
    candidates.push_back(*env_file);
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  // Earlier candidates win per key.
  std::unordered_map<std::string, std::string> merged;
  for (const auto &candidate : candidates) {
    for (auto &[key, value] : read_dotenv_file(candidate)) {
      merged.emplace(key, std::move(value));
    }
  }

  return overlay_from_env([&merged](const std::string &name) -> std::optional<std::string> {
    const auto it = merged.find(name);
    if (it == merged.end()) {
      return std::nullopt;
    }
    return it->second;
  });
}

common::Result<Config> load_config() {
  Config config;

  if (auto env_path = env_config_path(); env_path.has_value()) {
    if (auto status = apply_file_layer(config, *env_path); !status.ok()) {
      return common::Result<Config>::failure(status);
    }
  } else if (auto default_path = default_config_path(); default_path.ok()) {
    if (auto status = apply_file_layer(config, default_path.value()); !status.ok()) {
      return common::Result<Config>::failure(status);
    }
  }

  if (g_config_path_override.has_value()) {
    if (auto status = apply_file_layer(config, *g_config_path_override); !status.ok()) {
      return common::Result<Config>::failure(status);
    }
  }

  auto dotenv = load_dotenv_overlay();
  if (!dotenv.ok()) {
    return common::Result<Config>::failure(dotenv.status());
  }
  apply_overlay(config, dotenv.value());

  auto env = overlay_from_env(process_env_lookup());
  if (!env.ok()) {
    return common::Result<Config>::failure(env.status());
  }
  apply_overlay(config, env.value());

  if (auto validated = validate_config(config); !validated.ok()) {
    return common::Result<Config>::failure(validated.status());
  }
  return common::Result<Config>::success(std::move(config));
}

std::string render_config_toml(const Config &config) {
  const auto bool_to_toml = [](const bool value) { return value ? "true" : "false"; };
  std::ostringstream out;

  out << "[server]\n";
  out << "name = " << common::quote_toml_string(config.server.name) << "\n";
  out << "version = " << common::quote_toml_string(config.server.version) << "\n";
  out << "description = " << common::quote_toml_string(config.server.description) << "\n";
  out << "log_level = " << common::quote_toml_string(config.server.log_level) << "\n";
  out << "log_backend = " << common::quote_toml_string(config.server.log_backend) << "\n";

  out << "\n[security]\n";
  out << "session_timeout = " << config.security.session_timeout_secs << "\n";
  out << "command_timeout = " << config.security.command_timeout_secs << "\n";
  out << "max_output_size = " << config.security.max_output_size << "\n";
  out << "max_command_length = " << config.security.max_command_length << "\n";
  out << "allow_user_confirmation = " << bool_to_toml(config.security.allow_user_confirmation)
      << "\n";
  out << "require_session_id = " << bool_to_toml(config.security.require_session_id) << "\n";
  out << "allow_command_separators = " << bool_to_toml(config.security.allow_command_separators)
      << "\n";
  out << "allow_pipe = " << bool_to_toml(config.security.allow_pipe) << "\n";
  out << "allow_sequence = " << bool_to_toml(config.security.allow_sequence) << "\n";
  out << "allow_background = " << bool_to_toml(config.security.allow_background) << "\n";
  out << "allow_unrecognized_commands = "
      << bool_to_toml(config.security.allow_unrecognized_commands) << "\n";

  out << "\n[commands]\n";
  out << "read = " << common::toml_string_array(config.commands.read_commands) << "\n";
  out << "write = " << common::toml_string_array(config.commands.write_commands) << "\n";
  out << "system = " << common::toml_string_array(config.commands.system_commands) << "\n";
  out << "blocked = " << common::toml_string_array(config.commands.blocked_commands) << "\n";
  out << "dangerous_patterns = [\n";
  for (const auto &pattern : config.commands.dangerous_patterns) {
    out << "  " << common::quote_toml_string(pattern) << ",\n";
  }
  out << "]\n";

  out << "\n[output]\n";
  out << "max_size = " << config.output.max_size << "\n";
  out << "format = " << common::quote_toml_string(config.output.format) << "\n";
  return out.str();
}

common::Status save_config_to(const Config &config, const std::filesystem::path &path) {
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error(common::ErrorCode::Io,
                                   "Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      return common::Status::error(common::ErrorCode::Io,
                                   "Unable to write temporary config file " + tmp_path.string());
    }
    file << render_config_toml(config);
    file.flush();
    if (!file) {
      return common::Status::error(common::ErrorCode::Io,
                                   "Failed writing config file " + tmp_path.string());
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(tmp_path, path, rename_ec);
  if (rename_ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    return common::Status::error(common::ErrorCode::Io,
                                 "Failed to replace config file: " + rename_ec.message());
  }
  return common::Status::success();
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return path.status();
  }
  return save_config_to(config, path.value());
}

common::Result<std::vector<std::string>> validate_settings(const Config &config) {
  using WarningsResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (!is_known_log_level(config.server.log_level)) {
    return WarningsResult::failure(common::ErrorCode::ConfigurationError,
                                   "server.log_level: unknown level '" + config.server.log_level +
                                       "'");
  }
  const std::string backend = common::to_lower(config.server.log_backend);
  if (backend != "log" && backend != "none") {
    return WarningsResult::failure(common::ErrorCode::ConfigurationError,
                                   "server.log_backend: unknown backend '" +
                                       config.server.log_backend + "'");
  }

  if (config.security.session_timeout_secs == 0) {
    return WarningsResult::failure(common::ErrorCode::ConfigurationError,
                                   "security.session_timeout must be greater than 0");
  }
  if (config.security.command_timeout_secs == 0) {
    return WarningsResult::failure(common::ErrorCode::ConfigurationError,
                                   "security.command_timeout must be greater than 0");
  }
  if (config.security.max_output_size == 0) {
    return WarningsResult::failure(common::ErrorCode::ConfigurationError,
                                   "security.max_output_size must be greater than 0");
  }
  if (config.security.max_command_length == 0) {
    return WarningsResult::failure(common::ErrorCode::ConfigurationError,
                                   "security.max_command_length must be greater than 0");
  }
  if (config.output.max_size == 0) {
    return WarningsResult::failure(common::ErrorCode::ConfigurationError,
                                   "output.max_size must be greater than 0");
  }
  const std::string format = common::to_lower(config.output.format);
  if (format != "text" && format != "json") {
    return WarningsResult::failure(common::ErrorCode::ConfigurationError,
                                   "output.format: unknown format '" + config.output.format + "'");
  }

  for (const auto &[list_name, names] :
       std::array<std::pair<const char *, const std::vector<std::string> *>, 4>{{
           {"read", &config.commands.read_commands},
           {"write", &config.commands.write_commands},
           {"system", &config.commands.system_commands},
           {"blocked", &config.commands.blocked_commands},
       }}) {
    if (auto status = check_names(list_name, *names); !status.ok()) {
      return WarningsResult::failure(status);
    }
  }

  const auto &commands = config.commands;
  warn_overlaps("read", commands.read_commands, "write", commands.write_commands, warnings);
  warn_overlaps("read", commands.read_commands, "system", commands.system_commands, warnings);
  warn_overlaps("write", commands.write_commands, "system", commands.system_commands, warnings);
  warn_overlaps("blocked", commands.blocked_commands, "read", commands.read_commands, warnings);
  warn_overlaps("blocked", commands.blocked_commands, "write", commands.write_commands, warnings);
  warn_overlaps("blocked", commands.blocked_commands, "system", commands.system_commands,
                warnings);

  return WarningsResult::success(std::move(warnings));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  auto warnings = validate_settings(config);
  if (!warnings.ok()) {
    return warnings;
  }
  for (const auto &pattern : config.commands.dangerous_patterns) {
    try {
      const std::regex compiled(pattern, std::regex::ECMAScript);
      (void)compiled;
    } catch (const std::regex_error &e) {
      return common::Result<std::vector<std::string>>::failure(
          common::ErrorCode::ConfigurationError,
          "commands.dangerous_patterns: invalid pattern '" + pattern + "': " + e.what());
    }
  }
  return warnings;
}

std::vector<std::string> config_keys() {
  std::vector<std::string> keys;
  keys.reserve(key_bindings().size());
  for (const auto &binding : key_bindings()) {
    keys.emplace_back(binding.key);
  }
  return keys;
}

common::Result<std::string> get_config_value(const Config &config, const std::string &key) {
  const KeyBinding *binding = find_binding(common::trim(key));
  if (binding == nullptr) {
    return common::Result<std::string>::failure(common::ErrorCode::ConfigurationError,
                                                "unknown configuration key: " + key);
  }
  return common::Result<std::string>::success(render_value(overlay_from_config(config), *binding));
}

} // namespace shellguard::config
