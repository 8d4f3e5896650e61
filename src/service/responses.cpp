#include "shellguard/service/responses.hpp"

#include "shellguard/common/json_util.hpp"

#include <type_traits>

namespace shellguard::service {

namespace {

std::string segments_to_json(const std::vector<security::CommandSegment> &segments) {
  std::string out = "[";
  for (std::size_t i = 0; i < segments.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    const auto &segment = segments[i];
    common::JsonObjectWriter writer;
    writer.field("text", segment.text)
        .field("command", segment.base_command)
        .field("category", security::category_to_string(segment.category))
        .field("separator", security::separator_to_string(segment.introduced_by))
        .field("background", segment.background);
    out += writer.str();
  }
  out += "]";
  return out;
}

void write_segment_index(common::JsonObjectWriter &writer,
                         const std::optional<std::size_t> &segment_index) {
  if (segment_index.has_value()) {
    writer.field("segment_index", static_cast<std::uint64_t>(*segment_index));
  } else {
    writer.null_field("segment_index");
  }
}

} // namespace

std::string CommandResponse::to_json() const {
  common::JsonObjectWriter writer;
  writer.field("ok", true).field("verdict", verdict).field("success", success);
  writer.field("output", output).field("error", error);
  if (error_code.has_value()) {
    writer.field("error_code", *error_code);
  }
  if (exit_code.has_value()) {
    writer.field("exit_code", static_cast<std::int64_t>(*exit_code));
  } else {
    writer.null_field("exit_code");
  }
  writer.field("requires_approval", requires_approval);
  if (requires_approval) {
    writer.field("command_types", command_types);
  }
  writer.field("session_id", session_id);
  write_segment_index(writer, segment_index);
  writer.field("background", background).field("truncated", truncated).field("timed_out", timed_out);
  return writer.str();
}

std::string CommandLists::to_json() const {
  common::JsonObjectWriter writer;
  writer.field("ok", true)
      .field("read", read_commands)
      .field("write", write_commands)
      .field("system", system_commands)
      .field("blocked", blocked_commands);
  return writer.str();
}

std::string ApprovalResponse::to_json() const {
  common::JsonObjectWriter writer;
  writer.field("ok", true)
      .field("success", success)
      .field("message", message)
      .field("session_id", session_id)
      .field("scope", scope)
      .field("remember", remember);
  return writer.str();
}

std::string ConfigurationView::to_json() const {
  common::JsonObjectWriter server;
  server.field("name", config.server.name)
      .field("version", config.server.version)
      .field("description", config.server.description)
      .field("log_level", config.server.log_level)
      .field("log_backend", config.server.log_backend);

  const auto &sec = config.security;
  common::JsonObjectWriter security;
  security.field("session_timeout", sec.session_timeout_secs)
      .field("command_timeout", sec.command_timeout_secs)
      .field("max_output_size", sec.max_output_size)
      .field("max_command_length", sec.max_command_length)
      .field("allow_user_confirmation", sec.allow_user_confirmation)
      .field("require_session_id", sec.require_session_id)
      .field("allow_command_separators", sec.allow_command_separators)
      .field("allow_pipe", sec.allow_pipe)
      .field("allow_sequence", sec.allow_sequence)
      .field("allow_background", sec.allow_background)
      .field("allow_unrecognized_commands", sec.allow_unrecognized_commands);

  common::JsonObjectWriter commands;
  commands.field("read", config.commands.read_commands)
      .field("write", config.commands.write_commands)
      .field("system", config.commands.system_commands)
      .field("blocked", config.commands.blocked_commands)
      .field("dangerous_patterns", config.commands.dangerous_patterns);

  common::JsonObjectWriter output;
  output.field("max_size", config.output.max_size).field("format", config.output.format);

  common::JsonObjectWriter writer;
  writer.field("ok", true)
      .field("version", version)
      .raw_field("server", server.str())
      .raw_field("security", security.str())
      .raw_field("commands", commands.str())
      .raw_field("output", output.str())
      .field("warnings", warnings);
  if (persisted_to.has_value()) {
    writer.field("persisted_to", *persisted_to);
  }
  return writer.str();
}

std::string decision_to_json(const security::Decision &decision) {
  common::JsonObjectWriter writer;
  writer.field("ok", true).field("verdict", security::verdict_name(decision.verdict));
  std::visit(
      [&writer](const auto &verdict) {
        using T = std::decay_t<decltype(verdict)>;
        if constexpr (std::is_same_v<T, security::RequiresApproval>) {
          writer.field("command_types", security::categories_to_strings(verdict.categories));
        } else if constexpr (std::is_same_v<T, security::Rejected>) {
          writer.field("error_code", std::string(common::error_code_name(verdict.kind)))
              .field("reason", verdict.reason);
          write_segment_index(writer, verdict.segment_index);
        }
      },
      decision.verdict);
  writer.field("session_id", decision.session_id)
      .field("background", decision.background)
      .field("config_version", decision.config_version)
      .raw_field("segments", segments_to_json(decision.segments));
  return writer.str();
}

std::string error_to_json(const common::Status &status) {
  common::JsonObjectWriter writer;
  writer.field("ok", false)
      .field("error_code", std::string(common::error_code_name(status.code())))
      .field("error", status.error());
  return writer.str();
}

} // namespace shellguard::service
