#include "shellguard/common/json_util.hpp"

#include <cstdio>

namespace shellguard::common {

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += json_quote(values[i]);
  }
  out += "]";
  return out;
}

void JsonObjectWriter::append_key(const std::string &key) {
  if (!body_.empty()) {
    body_ += ",";
  }
  body_ += json_quote(key);
  body_ += ":";
}

JsonObjectWriter &JsonObjectWriter::field(const std::string &key, const std::string &value) {
  append_key(key);
  body_ += json_quote(value);
  return *this;
}

JsonObjectWriter &JsonObjectWriter::field(const std::string &key, const char *value) {
  return field(key, std::string(value == nullptr ? "" : value));
}

JsonObjectWriter &JsonObjectWriter::field(const std::string &key, const bool value) {
  append_key(key);
  body_ += value ? "true" : "false";
  return *this;
}

JsonObjectWriter &JsonObjectWriter::field(const std::string &key, const std::int64_t value) {
  append_key(key);
  body_ += std::to_string(value);
  return *this;
}

JsonObjectWriter &JsonObjectWriter::field(const std::string &key, const std::uint64_t value) {
  append_key(key);
  body_ += std::to_string(value);
  return *this;
}

JsonObjectWriter &JsonObjectWriter::field(const std::string &key,
                                          const std::vector<std::string> &values) {
  append_key(key);
  body_ += json_string_array(values);
  return *this;
}

JsonObjectWriter &JsonObjectWriter::null_field(const std::string &key) {
  append_key(key);
  body_ += "null";
  return *this;
}

JsonObjectWriter &JsonObjectWriter::raw_field(const std::string &key, const std::string &json) {
  append_key(key);
  body_ += json;
  return *this;
}

std::string JsonObjectWriter::str() const { return "{" + body_ + "}"; }

} // namespace shellguard::common
