#pragma once

#include "shellguard/common/result.hpp"
#include "shellguard/config/schema.hpp"
#include "shellguard/security/category.hpp"

#include <string>
#include <vector>

namespace shellguard::security {

enum class Separator { None, Pipe, Sequence, Background };

[[nodiscard]] std::string separator_to_string(Separator separator);

struct Token {
  std::string text;
  bool quoted = false;
};

struct CommandSegment {
  std::vector<Token> tokens;
  std::string text;
  Separator introduced_by = Separator::None;
  bool background = false;
  std::string base_command;
  Category category = Category::Unrecognized;
  /// Unquoted separator characters that were present but not enabled.
  std::vector<char> disabled_separators;
};

struct SeparatorPolicy {
  bool allow_pipe = true;
  bool allow_sequence = true;
  bool allow_background = true;

  [[nodiscard]] static SeparatorPolicy from_config(const config::SecurityConfig &security);
  [[nodiscard]] bool allows(char separator) const;
};

/// Splits `raw` into segments on enabled, unquoted `|`, `;` and `&`. An
/// unquoted line break ends a segment like `;` and is governed by the same
/// policy flag. Fails with MalformedInput on unterminated quotes and empty
/// segments.
[[nodiscard]] common::Result<std::vector<CommandSegment>>
parse_command_line(const std::string &raw, const SeparatorPolicy &policy = {});

/// First token stripped of directory components; `/` or `dir/` keep their text.
[[nodiscard]] std::string base_command_name(const std::string &first_token);

} // namespace shellguard::security
