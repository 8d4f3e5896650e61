#include "shellguard/common/toml.hpp"

#include "shellguard/common/fs.hpp"

#include <algorithm>
#include <sstream>

namespace shellguard::common {

namespace {

// Walks TOML text while tracking whether the cursor sits inside a basic
// ("...") or literal ('...') string.
class StringTracker {
public:
  void feed(const char ch) {
    if (in_basic_) {
      if (escaped_) {
        escaped_ = false;
      } else if (ch == '\\') {
        escaped_ = true;
      } else if (ch == '"') {
        in_basic_ = false;
      }
      return;
    }
    if (in_literal_) {
      if (ch == '\'') {
        in_literal_ = false;
      }
      return;
    }
    if (ch == '"') {
      in_basic_ = true;
    } else if (ch == '\'') {
      in_literal_ = true;
    }
  }

  [[nodiscard]] bool in_string() const { return in_basic_ || in_literal_; }

private:
  bool in_basic_ = false;
  bool in_literal_ = false;
  bool escaped_ = false;
};

std::string strip_comment(const std::string &line) {
  StringTracker tracker;
  std::string output;
  output.reserve(line.size());

  for (const char ch : line) {
    if (!tracker.in_string() && ch == '#') {
      break;
    }
    tracker.feed(ch);
    output.push_back(ch);
  }

  return output;
}

int bracket_balance(const std::string &text) {
  StringTracker tracker;
  int depth = 0;
  for (const char ch : text) {
    const bool was_in_string = tracker.in_string();
    tracker.feed(ch);
    if (was_in_string || tracker.in_string()) {
      continue;
    }
    if (ch == '[') {
      ++depth;
    } else if (ch == ']') {
      --depth;
    }
  }
  return depth;
}

std::vector<std::string> split_array_elements(const std::string &array_body) {
  std::vector<std::string> result;
  std::string current;
  StringTracker tracker;

  for (const char ch : array_body) {
    if (!tracker.in_string() && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }
    tracker.feed(ch);
    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

Result<std::string> decode_string(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return Result<std::string>::success(value.substr(1, value.size() - 2));
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return Result<std::string>::failure(ErrorCode::ConfigurationError,
                                        "expected a quoted string, got: " + value);
  }

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
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case '"':
    case '\\':
      out.push_back(ch);
      break;
    default:
      return Result<std::string>::failure(ErrorCode::ConfigurationError,
                                          std::string("invalid escape sequence \\") + ch +
                                              " in " + value);
    }
    escaped = false;
  }
  if (escaped) {
    return Result<std::string>::failure(ErrorCode::ConfigurationError,
                                        "dangling escape in " + value);
  }
  return Result<std::string>::success(std::move(out));
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::vector<std::string> TomlDocument::keys() const {
  std::vector<std::string> out;
  out.reserve(values.size());
  for (const auto &[key, value] : values) {
    (void)value;
    out.push_back(key);
  }
  std::sort(out.begin(), out.end());
  return out;
}

Result<std::string> TomlDocument::get_string(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return Result<std::string>::failure(ErrorCode::ConfigurationError, "missing key: " + key);
  }
  auto decoded = decode_string(it->second);
  if (!decoded.ok()) {
    return Result<std::string>::failure(ErrorCode::ConfigurationError,
                                        key + ": " + decoded.error());
  }
  return decoded;
}

Result<bool> TomlDocument::get_bool(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return Result<bool>::failure(ErrorCode::ConfigurationError, "missing key: " + key);
  }
  const std::string normalized = trim(it->second);
  if (normalized == "true") {
    return Result<bool>::success(true);
  }
  if (normalized == "false") {
    return Result<bool>::success(false);
  }
  return Result<bool>::failure(ErrorCode::ConfigurationError,
                               key + ": expected true or false, got: " + normalized);
}

Result<std::uint64_t> TomlDocument::get_u64(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return Result<std::uint64_t>::failure(ErrorCode::ConfigurationError, "missing key: " + key);
  }
  auto parsed = parse_u64(it->second);
  if (!parsed.ok()) {
    return Result<std::uint64_t>::failure(ErrorCode::ConfigurationError,
                                          key + ": " + parsed.error());
  }
  return parsed;
}

Result<std::vector<std::string>> TomlDocument::get_string_array(const std::string &key) const {
  using ArrayResult = Result<std::vector<std::string>>;
  const auto it = values.find(key);
  if (it == values.end()) {
    return ArrayResult::failure(ErrorCode::ConfigurationError, "missing key: " + key);
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return ArrayResult::failure(ErrorCode::ConfigurationError, key + ": expected an array");
  }

  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (element.empty()) {
      continue;
    }
    auto decoded = decode_string(element);
    if (!decoded.ok()) {
      return ArrayResult::failure(ErrorCode::ConfigurationError, key + ": " + decoded.error());
    }
    values_out.push_back(std::move(decoded.value()));
  }

  return ArrayResult::success(std::move(values_out));
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[') {
      if (clean_line.size() >= 2 && clean_line[1] == '[') {
        return Result<TomlDocument>::failure(
            ErrorCode::ConfigurationError,
            "Arrays of tables are not supported at line " + std::to_string(line_number));
      }
      if (clean_line.back() != ']') {
        return Result<TomlDocument>::failure(
            ErrorCode::ConfigurationError,
            "Invalid section header at line " + std::to_string(line_number));
      }
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure(
            ErrorCode::ConfigurationError,
            "Invalid empty section at line " + std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure(
          ErrorCode::ConfigurationError,
          "Invalid key/value at line " + std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure(
          ErrorCode::ConfigurationError, "Missing key at line " + std::to_string(line_number));
    }

    const std::size_t start_line = line_number;
    while (!value.empty() && value.front() == '[' && bracket_balance(value) > 0) {
      if (!std::getline(stream, line)) {
        return Result<TomlDocument>::failure(
            ErrorCode::ConfigurationError,
            "Unterminated array starting at line " + std::to_string(start_line));
      }
      ++line_number;
      value += " " + trim(strip_comment(line));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (document.values.contains(full_key)) {
      return Result<TomlDocument>::failure(
          ErrorCode::ConfigurationError,
          "Duplicate key " + full_key + " at line " + std::to_string(start_line));
    }
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    switch (ch) {
    case '"':
    case '\\':
      escaped.push_back('\\');
      escaped.push_back(ch);
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\r':
      escaped += "\\r";
      break;
    default:
      escaped.push_back(ch);
      break;
    }
  }
  escaped.push_back('"');
  return escaped;
}

std::string toml_string_array(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

} // namespace shellguard::common
