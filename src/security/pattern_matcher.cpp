#include "shellguard/security/pattern_matcher.hpp"

namespace shellguard::security {

common::Result<PatternMatcher> PatternMatcher::compile(const std::vector<std::string> &patterns) {
  PatternMatcher matcher;
  matcher.patterns_.reserve(patterns.size());
  for (const auto &pattern : patterns) {
    try {
      matcher.patterns_.push_back({pattern, std::regex(pattern, std::regex::ECMAScript)});
    } catch (const std::regex_error &e) {
      return common::Result<PatternMatcher>::failure(
          common::ErrorCode::ConfigurationError,
          "commands.dangerous_patterns: invalid pattern '" + pattern + "': " + e.what());
    }
  }
  return common::Result<PatternMatcher>::success(std::move(matcher));
}

std::optional<PatternMatch> PatternMatcher::find(const std::string &raw,
                                                 const std::vector<CommandSegment> &segments) const {
  for (const auto &pattern : patterns_) {
    if (!std::regex_search(raw, pattern.regex)) {
      continue;
    }
    PatternMatch match{pattern.source, std::nullopt};
    for (std::size_t index = 0; index < segments.size(); ++index) {
      if (std::regex_search(segments[index].text, pattern.regex)) {
        match.segment_index = index;
        break;
      }
    }
    return match;
  }

  // Anchored patterns can hit a segment without hitting the whole line.
  for (std::size_t index = 0; index < segments.size(); ++index) {
    for (const auto &pattern : patterns_) {
      if (std::regex_search(segments[index].text, pattern.regex)) {
        return PatternMatch{pattern.source, index};
      }
    }
  }
  return std::nullopt;
}

} // namespace shellguard::security
