#pragma once

#include "shellguard/common/result.hpp"
#include "shellguard/security/command_parser.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace shellguard::security {

struct PatternMatch {
  std::string pattern;
  std::optional<std::size_t> segment_index;
};

/// Ordered list of unanchored ECMAScript regexes. Immutable once compiled, so
/// a single instance may be shared across threads.
class PatternMatcher {
public:
  PatternMatcher() = default;

  [[nodiscard]] static common::Result<PatternMatcher>
  compile(const std::vector<std::string> &patterns);

  /// Full raw string first, then each segment in order. The first pattern in
  /// configured order that hits wins.
  [[nodiscard]] std::optional<PatternMatch> find(const std::string &raw,
                                                 const std::vector<CommandSegment> &segments) const;

  [[nodiscard]] std::size_t size() const { return patterns_.size(); }

private:
  struct CompiledPattern {
    std::string source;
    std::regex regex;
  };

  std::vector<CompiledPattern> patterns_;
};

} // namespace shellguard::security
