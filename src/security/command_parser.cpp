#include "shellguard/security/command_parser.hpp"

#include "shellguard/common/fs.hpp"

#include <cctype>

namespace shellguard::security {

namespace {

using SegmentsResult = common::Result<std::vector<CommandSegment>>;

Separator separator_for(const char ch) {
  switch (ch) {
  case '|':
    return Separator::Pipe;
  case ';':
    return Separator::Sequence;
  case '&':
    return Separator::Background;
  default:
    return Separator::None;
  }
}

bool is_separator_char(const char ch) { return ch == '|' || ch == ';' || ch == '&'; }

class SegmentBuilder {
public:
  explicit SegmentBuilder(const std::string &raw) : raw_(raw) {}

  void append(const char ch) {
    token_.text.push_back(ch);
    token_started_ = true;
  }

  void mark_quoted() {
    token_.quoted = true;
    token_started_ = true;
  }

  void note_disabled(const char ch) {
    for (const char seen : current_.disabled_separators) {
      if (seen == ch) {
        return;
      }
    }
    current_.disabled_separators.push_back(ch);
  }

  void flush_token() {
    if (token_started_) {
      current_.tokens.push_back(std::move(token_));
    }
    token_ = Token{};
    token_started_ = false;
  }

  [[nodiscard]] bool empty() const { return !token_started_ && current_.tokens.empty(); }

  /// Closes the segment that ends at `end` (exclusive).
  common::Status close_segment(const std::size_t end, const Separator next,
                               const bool line_break = false) {
    flush_token();
    if (current_.tokens.empty()) {
      return common::Status::error(common::ErrorCode::MalformedInput,
                                   empty_segment_message(next));
    }
    current_.text = common::trim(raw_.substr(start_, end - start_));
    current_.base_command = base_command_name(current_.tokens.front().text);
    if (next == Separator::Background) {
      current_.background = true;
    }
    segments_.push_back(std::move(current_));
    current_ = CommandSegment{};
    current_.introduced_by = next;
    last_separator_ = next;
    ended_by_line_break_ = line_break;
    start_ = end + 1;
    return common::Status::success();
  }

  SegmentsResult finish() {
    flush_token();
    if (current_.tokens.empty()) {
      if (segments_.empty()) {
        return SegmentsResult::failure(common::ErrorCode::MalformedInput, "empty command");
      }
      if (last_separator_ != Separator::Background && !ended_by_line_break_) {
        return SegmentsResult::failure(common::ErrorCode::MalformedInput,
                                       "empty command segment after '" +
                                           separator_to_string(last_separator_) + "'");
      }
      return SegmentsResult::success(std::move(segments_));
    }
    const auto status = close_segment(raw_.size(), Separator::None);
    if (!status.ok()) {
      return SegmentsResult::failure(status);
    }
    return SegmentsResult::success(std::move(segments_));
  }

private:
  std::string empty_segment_message(const Separator next) const {
    if (segments_.empty()) {
      return "empty command segment before '" + separator_to_string(next) + "'";
    }
    return "empty command segment after '" + separator_to_string(last_separator_) + "'";
  }

  const std::string &raw_;
  std::vector<CommandSegment> segments_;
  CommandSegment current_;
  Token token_;
  bool token_started_ = false;
  std::size_t start_ = 0;
  Separator last_separator_ = Separator::None;
  bool ended_by_line_break_ = false;
};

} // namespace

std::string separator_to_string(const Separator separator) {
  switch (separator) {
  case Separator::None:
    return "";
  case Separator::Pipe:
    return "|";
  case Separator::Sequence:
    return ";";
  case Separator::Background:
    return "&";
  }
  return "";
}

SeparatorPolicy SeparatorPolicy::from_config(const config::SecurityConfig &security) {
  SeparatorPolicy policy;
  policy.allow_pipe = security.allow_command_separators && security.allow_pipe;
  policy.allow_sequence = security.allow_command_separators && security.allow_sequence;
  policy.allow_background = security.allow_command_separators && security.allow_background;
  return policy;
}

bool SeparatorPolicy::allows(const char separator) const {
  switch (separator) {
  case '|':
    return allow_pipe;
  case ';':
    return allow_sequence;
  case '&':
    return allow_background;
  default:
    return false;
  }
}

std::string base_command_name(const std::string &first_token) {
  const auto slash = first_token.find_last_of('/');
  if (slash == std::string::npos) {
    return first_token;
  }
  std::string base = first_token.substr(slash + 1);
  if (base.empty()) {
    return first_token;
  }
  return base;
}

common::Result<std::vector<CommandSegment>> parse_command_line(const std::string &raw,
                                                               const SeparatorPolicy &policy) {
  SegmentBuilder builder(raw);
  char open_quote = '\0';

  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    const char next = i + 1 < raw.size() ? raw[i + 1] : '\0';

    if (open_quote != '\0') {
      if (ch == '\\' && next == open_quote) {
        builder.append(next);
        ++i;
      } else if (ch == open_quote) {
        open_quote = '\0';
      } else {
        builder.append(ch);
      }
      continue;
    }

    if (ch == '\\' && (next == '"' || next == '\'')) {
      builder.append(next);
      ++i;
      continue;
    }
    if (ch == '"' || ch == '\'') {
      open_quote = ch;
      builder.mark_quoted();
      continue;
    }
    if (ch == '\n' || ch == '\r') {
      // The shell runs each line as its own command.
      if (ch == '\r' && next == '\n') {
        continue;
      }
      if (builder.empty()) {
        continue;
      }
      if (!policy.allows(';')) {
        builder.flush_token();
        builder.note_disabled('\n');
        continue;
      }
      const auto status = builder.close_segment(i, Separator::Sequence, true);
      if (!status.ok()) {
        return SegmentsResult::failure(status);
      }
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      builder.flush_token();
      continue;
    }
    if (is_separator_char(ch)) {
      if (!policy.allows(ch)) {
        builder.note_disabled(ch);
        builder.append(ch);
        continue;
      }
      const auto status = builder.close_segment(i, separator_for(ch));
      if (!status.ok()) {
        return SegmentsResult::failure(status);
      }
      continue;
    }
    builder.append(ch);
  }

  if (open_quote != '\0') {
    return SegmentsResult::failure(common::ErrorCode::MalformedInput,
                                   std::string("unterminated ") +
                                       (open_quote == '"' ? "double" : "single") + " quote");
  }
  return builder.finish();
}

} // namespace shellguard::security
