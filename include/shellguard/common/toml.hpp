#pragma once

#include "shellguard/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace shellguard::common {

/// Flat view of a TOML subset document: `section.key` -> raw value text.
/// Supports basic and literal strings, booleans, integers and (multi-line)
/// string arrays.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::vector<std::string> keys() const;

  [[nodiscard]] Result<std::string> get_string(const std::string &key) const;
  [[nodiscard]] Result<bool> get_bool(const std::string &key) const;
  [[nodiscard]] Result<std::uint64_t> get_u64(const std::string &key) const;
  [[nodiscard]] Result<std::vector<std::string>> get_string_array(const std::string &key) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);
[[nodiscard]] std::string toml_string_array(const std::vector<std::string> &values);

} // namespace shellguard::common
