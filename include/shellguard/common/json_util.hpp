#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shellguard::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote and escape a string as a JSON string literal.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Render a JSON array of strings.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Builds a single-line JSON object, fields in insertion order.
class JsonObjectWriter {
public:
  JsonObjectWriter &field(const std::string &key, const std::string &value);
  JsonObjectWriter &field(const std::string &key, const char *value);
  JsonObjectWriter &field(const std::string &key, bool value);
  JsonObjectWriter &field(const std::string &key, std::int64_t value);
  JsonObjectWriter &field(const std::string &key, std::uint64_t value);
  JsonObjectWriter &field(const std::string &key, const std::vector<std::string> &values);
  JsonObjectWriter &null_field(const std::string &key);
  /// `json` must already be valid JSON.
  JsonObjectWriter &raw_field(const std::string &key, const std::string &json);

  [[nodiscard]] std::string str() const;

private:
  void append_key(const std::string &key);

  std::string body_;
};

} // namespace shellguard::common
