#include "test_framework.hpp"

#include "shellguard/security/command_parser.hpp"

namespace {

namespace sec = shellguard::security;

std::vector<std::string> token_texts(const sec::CommandSegment &segment) {
  std::vector<std::string> out;
  for (const auto &token : segment.tokens) {
    out.push_back(token.text);
  }
  return out;
}

} // namespace

void register_parser_tests(std::vector<shellguard::tests::TestCase> &tests) {
  using shellguard::tests::require;
  using shellguard::common::ErrorCode;

  tests.push_back({"parser_single_command", [] {
                     const auto parsed = sec::parse_command_line("  ls -la /tmp  ");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().size() == 1, "expected one segment");
                     const auto &segment = parsed.value()[0];
                     require(segment.base_command == "ls", "base command mismatch");
                     require(segment.text == "ls -la /tmp", "segment text should be trimmed");
                     require(token_texts(segment) == std::vector<std::string>({"ls", "-la", "/tmp"}),
                             "tokens mismatch");
                     require(segment.introduced_by == sec::Separator::None,
                             "first segment has no separator");
                     require(!segment.background, "foreground expected");
                   }});

  tests.push_back({"parser_splits_on_each_separator", [] {
                     const auto parsed = sec::parse_command_line("ls -la | grep foo; pwd & date");
                     require(parsed.ok(), parsed.error());
                     const auto &segments = parsed.value();
                     require(segments.size() == 4, "expected four segments");
                     require(segments[0].base_command == "ls", "segment 0 mismatch");
                     require(segments[1].base_command == "grep", "segment 1 mismatch");
                     require(segments[1].introduced_by == sec::Separator::Pipe, "pipe expected");
                     require(segments[2].introduced_by == sec::Separator::Sequence,
                             "sequence expected");
                     require(segments[2].background, "segment before & should be background");
                     require(segments[3].introduced_by == sec::Separator::Background,
                             "background separator expected");
                     require(!segments[3].background, "last segment runs in foreground");
                     require(segments[1].text == "grep foo", "segment text mismatch");
                   }});

  tests.push_back({"parser_trailing_ampersand_tags_last_segment", [] {
                     const auto parsed = sec::parse_command_line("sleep 10 &");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().size() == 1, "trailing & adds no segment");
                     require(parsed.value()[0].background, "segment should be background");
                     require(parsed.value()[0].text == "sleep 10", "text should exclude &");
                   }});

  tests.push_back({"parser_quotes_protect_separators_and_spaces", [] {
                     const auto parsed =
                         sec::parse_command_line(R"(grep "a | b; c" 'x & y' file)");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().size() == 1, "quoted separators must not split");
                     const auto tokens = token_texts(parsed.value()[0]);
                     require(tokens == std::vector<std::string>({"grep", "a | b; c", "x & y", "file"}),
                             "quoted tokens mismatch");
                     require(parsed.value()[0].tokens[1].quoted, "token should be marked quoted");
                     require(!parsed.value()[0].tokens[0].quoted, "bare token is not quoted");
                   }});

  tests.push_back({"parser_escaped_quotes_are_literal", [] {
                     const auto inside = sec::parse_command_line(R"(echo "say \"hi\"")");
                     require(inside.ok(), inside.error());
                     require(token_texts(inside.value()[0])[1] == R"(say "hi")",
                             "escaped double quote inside quotes mismatch");

                     const auto outside = sec::parse_command_line(R"(echo it\'s)");
                     require(outside.ok(), outside.error());
                     require(token_texts(outside.value()[0])[1] == "it's",
                             "escaped quote outside quotes should not open a span");

                     const auto other = sec::parse_command_line(R"(echo a\b)");
                     require(other.ok(), other.error());
                     require(token_texts(other.value()[0])[1] == R"(a\b)",
                             "other backslashes are kept");
                   }});

  tests.push_back({"parser_empty_quotes_make_a_token", [] {
                     const auto parsed = sec::parse_command_line(R"(echo "" x)");
                     require(parsed.ok(), parsed.error());
                     require(token_texts(parsed.value()[0]) == std::vector<std::string>({"echo", "", "x"}),
                             "empty quoted token should be kept");
                   }});

  tests.push_back({"parser_unterminated_quotes_are_malformed", [] {
                     const auto dq = sec::parse_command_line(R"(ls "unterminated)");
                     require(!dq.ok(), "unterminated double quote should fail");
                     require(dq.code() == ErrorCode::MalformedInput, "expected malformed input");
                     require(dq.error() == "unterminated double quote", dq.error());

                     const auto sq = sec::parse_command_line("echo 'open");
                     require(!sq.ok(), "unterminated single quote should fail");
                     require(sq.error() == "unterminated single quote", sq.error());
                   }});

  tests.push_back({"parser_empty_input_is_malformed", [] {
                     for (const auto *input : {"", "   ", "\t\n"}) {
                       const auto parsed = sec::parse_command_line(input);
                       require(!parsed.ok(), "empty input should fail");
                       require(parsed.code() == ErrorCode::MalformedInput,
                               "expected malformed input");
                       require(parsed.error() == "empty command", parsed.error());
                     }
                   }});

  tests.push_back({"parser_empty_segments_are_malformed", [] {
                     for (const auto *input :
                          {"ls ;; pwd", "; ls", "| ls", "ls && pwd", "ls || pwd", "ls |", "ls ;",
                           "ls & ; pwd", "&"}) {
                       const auto parsed = sec::parse_command_line(input);
                       require(!parsed.ok(), std::string("expected failure for: ") + input);
                       require(parsed.code() == ErrorCode::MalformedInput,
                               std::string("expected malformed input for: ") + input);
                     }
                     const auto leading = sec::parse_command_line("; ls");
                     require(leading.error() == "empty command segment before ';'", leading.error());
                     const auto doubled = sec::parse_command_line("ls && pwd");
                     require(doubled.error() == "empty command segment after '&'", doubled.error());
                     const auto trailing = sec::parse_command_line("ls |");
                     require(trailing.error() == "empty command segment after '|'", trailing.error());
                   }});

  tests.push_back({"parser_disabled_separator_is_recorded_not_split", [] {
                     sec::SeparatorPolicy policy;
                     policy.allow_pipe = false;
                     const auto parsed = sec::parse_command_line("ls | grep x; pwd", policy);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().size() == 2, "only ; should split");
                     require(parsed.value()[0].disabled_separators == std::vector<char>({'|'}),
                             "disabled pipe should be recorded on segment 0");
                     require(parsed.value()[1].disabled_separators.empty(),
                             "segment 1 has no disabled separators");

                     const auto quoted = sec::parse_command_line("grep '|' file", policy);
                     require(quoted.ok(), quoted.error());
                     require(quoted.value()[0].disabled_separators.empty(),
                             "quoted separators are never recorded");
                   }});

  tests.push_back({"parser_line_breaks_split_like_semicolons", [] {
                     const auto parsed = sec::parse_command_line("ls\nsudo reboot");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().size() == 2, "each line is its own command");
                     require(parsed.value()[1].base_command == "sudo", "second line mismatch");
                     require(parsed.value()[1].introduced_by == sec::Separator::Sequence,
                             "a line break acts as ;");
                     require(parsed.value()[1].text == "sudo reboot", "segment text mismatch");

                     const auto crlf = sec::parse_command_line("cat f\r\nrm x");
                     require(crlf.ok(), crlf.error());
                     require(crlf.value().size() == 2 && crlf.value()[0].text == "cat f" &&
                                 crlf.value()[1].base_command == "rm",
                             "CRLF should split once");

                     const auto lone_cr = sec::parse_command_line("ls\rpwd");
                     require(lone_cr.ok() && lone_cr.value().size() == 2, "a bare CR also splits");
                   }});

  tests.push_back({"parser_blank_lines_and_continuations", [] {
                     const auto padded = sec::parse_command_line("\n\nls\n\npwd\n");
                     require(padded.ok(), padded.error());
                     require(padded.value().size() == 2, "blank lines add no segments");

                     const auto piped = sec::parse_command_line("ls |\n  grep x");
                     require(piped.ok(), piped.error());
                     require(piped.value().size() == 2, "a pipe may continue on the next line");
                     require(piped.value()[1].introduced_by == sec::Separator::Pipe,
                             "the pipe introduces the next line");

                     const auto quoted = sec::parse_command_line("echo 'a\nb'");
                     require(quoted.ok(), quoted.error());
                     require(quoted.value().size() == 1, "quoted line breaks do not split");
                     require(quoted.value()[0].tokens[1].text == "a\nb", "quoted text kept");

                     const auto after_semicolon = sec::parse_command_line("ls;\n");
                     require(!after_semicolon.ok(), "a dangling ; stays malformed");
                   }});

  tests.push_back({"parser_line_break_follows_sequence_policy", [] {
                     sec::SeparatorPolicy policy;
                     policy.allow_sequence = false;
                     const auto parsed = sec::parse_command_line("ls\nsudo reboot", policy);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().size() == 1, "disabled line breaks do not split");
                     require(parsed.value()[0].disabled_separators == std::vector<char>({'\n'}),
                             "the line break should be recorded");
                   }});

  tests.push_back({"separator_policy_master_switch", [] {
                     shellguard::config::SecurityConfig security;
                     security.allow_command_separators = false;
                     const auto off = sec::SeparatorPolicy::from_config(security);
                     require(!off.allows('|') && !off.allows(';') && !off.allows('&'),
                             "master switch should disable every separator");

                     security.allow_command_separators = true;
                     security.allow_background = false;
                     const auto partial = sec::SeparatorPolicy::from_config(security);
                     require(partial.allows('|') && partial.allows(';'), "pipe and sequence stay on");
                     require(!partial.allows('&'), "background should be off");
                     require(!partial.allows('x'), "non-separators are never allowed");
                   }});

  tests.push_back({"base_command_strips_directories", [] {
                     require(sec::base_command_name("/bin/ls") == "ls", "absolute path");
                     require(sec::base_command_name("./scripts/run") == "run", "relative path");
                     require(sec::base_command_name("ls") == "ls", "bare name");
                     require(sec::base_command_name("/") == "/", "root keeps its text");
                     require(sec::base_command_name("dir/") == "dir/", "trailing slash keeps text");

                     const auto parsed = sec::parse_command_line("/usr/bin/cat notes.txt");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value()[0].base_command == "cat", "parsed base command");
                   }});

  tests.push_back({"separator_to_string_names", [] {
                     require(sec::separator_to_string(sec::Separator::Pipe) == "|", "pipe");
                     require(sec::separator_to_string(sec::Separator::Sequence) == ";", "sequence");
                     require(sec::separator_to_string(sec::Separator::Background) == "&",
                             "background");
                     require(sec::separator_to_string(sec::Separator::None).empty(), "none");
                   }});
}
