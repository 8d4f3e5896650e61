#include "shellguard/service/command_service.hpp"

#include "shellguard/common/fs.hpp"
#include "shellguard/observability/global.hpp"

#include <algorithm>
#include <sstream>

namespace shellguard::service {

namespace {

CommandResponse response_from_decision(const security::Decision &decision) {
  CommandResponse response;
  response.verdict = security::verdict_name(decision.verdict);
  response.session_id = decision.session_id;
  response.background = decision.background;
  if (const auto *rejected = std::get_if<security::Rejected>(&decision.verdict);
      rejected != nullptr) {
    response.error = rejected->reason;
    response.error_code = std::string(common::error_code_name(rejected->kind));
    response.segment_index = rejected->segment_index;
  } else if (const auto *pending = std::get_if<security::RequiresApproval>(&decision.verdict);
             pending != nullptr) {
    response.requires_approval = true;
    response.command_types = security::categories_to_strings(pending->categories);
    response.error = "command requires approval for: " + common::join(response.command_types, ", ") +
                     ". Approve with approve_command_type using session " + decision.session_id;
  }
  return response;
}

std::string on_off(const bool value) { return value ? "enabled" : "disabled"; }

} // namespace

CommandService::CommandService(std::unique_ptr<config::ConfigStore> store,
                               std::unique_ptr<exec::IExecutor> executor)
    : store_(std::move(store)),
      sessions_(std::chrono::seconds(store_->snapshot()->config.security.session_timeout_secs)),
      engine_(*store_, sessions_), executor_(std::move(executor)) {
  store_->add_publish_listener([this](const config::ConfigSnapshot &snapshot) {
    sessions_.set_ttl(std::chrono::seconds(snapshot.config.security.session_timeout_secs));
  });
}

common::Result<security::Decision>
CommandService::check(const std::string &command, const std::optional<std::string> &session_id) {
  return engine_.evaluate(security::RawCommand{.command = command, .session_id = session_id});
}

common::Result<CommandResponse>
CommandService::execute_command(const std::string &command,
                                const std::optional<std::string> &session_id) {
  auto decision = check(command, session_id);
  if (!decision.ok()) {
    return common::Result<CommandResponse>::failure(decision.status());
  }
  if (!security::is_approved(decision.value().verdict)) {
    return common::Result<CommandResponse>::success(response_from_decision(decision.value()));
  }

  auto &approved = decision.value();
  if (!approved.one_shot.empty() && !sessions_.claim_once(approved.session_id, approved.one_shot)) {
    // Another command spent the grant after this one was evaluated.
    approved.verdict = security::RequiresApproval{.categories = approved.one_shot};
    return common::Result<CommandResponse>::success(response_from_decision(approved));
  }

  auto response = run_approved(approved, command);
  if (!response.ok() && !approved.one_shot.empty()) {
    sessions_.restore_once(approved.session_id, approved.one_shot);
  }
  return response;
}

common::Result<CommandResponse> CommandService::execute_read_command(const std::string &command) {
  auto decision = check(command, std::nullopt);
  if (!decision.ok()) {
    return common::Result<CommandResponse>::failure(decision.status());
  }
  if (std::holds_alternative<security::Rejected>(decision.value().verdict)) {
    return common::Result<CommandResponse>::success(response_from_decision(decision.value()));
  }

  for (std::size_t index = 0; index < decision.value().segments.size(); ++index) {
    const auto &segment = decision.value().segments[index];
    if (segment.category == security::Category::Read) {
      continue;
    }
    CommandResponse response;
    response.verdict = "rejected";
    response.session_id = decision.value().session_id;
    response.segment_index = index;
    response.error_code = std::string(common::error_code_name(common::ErrorCode::CommandNotPermitted));
    response.error = "command type mismatch: '" + segment.base_command + "' is a " +
                     security::category_to_string(segment.category) +
                     " command; execute_read_command only runs read commands, use "
                     "execute_command instead";
    return common::Result<CommandResponse>::success(std::move(response));
  }
  return run_approved(decision.value(), command);
}

common::Result<CommandResponse> CommandService::run_approved(const security::Decision &decision,
                                                             const std::string &command) {
  const auto snapshot = store_->snapshot();
  const auto &sec = snapshot->config.security;

  exec::ExecRequest request;
  request.command = command;
  // `sh -c` detaches inner `&` jobs itself; only a trailing one leaves
  // nothing in the foreground to capture.
  request.background = !decision.segments.empty() && decision.segments.back().background;
  request.timeout = std::chrono::seconds(sec.command_timeout_secs);
  request.output_cap = static_cast<std::size_t>(
      std::min(sec.max_output_size, snapshot->config.output.max_size));

  auto result = executor_->run(request);
  if (!result.ok()) {
    observability::record_error("executor", result.error());
    return common::Result<CommandResponse>::failure(result.status());
  }

  const auto &exec_result = result.value();
  observability::record_command_executed(command, exec_result.exit_code, exec_result.duration,
                                         exec_result.truncated, exec_result.timed_out);

  CommandResponse response = response_from_decision(decision);
  response.success = exec_result.success();
  response.output = exec_result.stdout_text;
  response.error = exec_result.stderr_text;
  response.exit_code = exec_result.exit_code;
  response.truncated = exec_result.truncated;
  response.timed_out = exec_result.timed_out;
  return common::Result<CommandResponse>::success(std::move(response));
}

CommandLists CommandService::list_available_commands() const {
  const auto snapshot = store_->snapshot();
  const auto &commands = snapshot->config.commands;
  return CommandLists{.read_commands = commands.read_commands,
                      .write_commands = commands.write_commands,
                      .system_commands = commands.system_commands,
                      .blocked_commands = commands.blocked_commands};
}

std::string CommandService::get_command_help() const {
  const auto snapshot = store_->snapshot();
  const auto &config = snapshot->config;
  const auto &sec = config.security;

  std::ostringstream out;
  out << config.server.name << " " << config.server.version << "\n";
  out << config.server.description << "\n\n";
  out << "Command categories:\n";
  out << "  read    run without approval: " << common::join(config.commands.read_commands, ", ")
      << "\n";
  out << "  write   need approval: " << common::join(config.commands.write_commands, ", ") << "\n";
  out << "  system  need approval: " << common::join(config.commands.system_commands, ", ")
      << "\n";
  out << "  blocked never run: " << common::join(config.commands.blocked_commands, ", ") << "\n";
  out << "  other commands are "
      << (sec.allow_unrecognized_commands ? "treated as system commands" : "rejected")
      << "\n\n";

  out << "Command chaining:\n";
  out << "  pipe (|)        " << on_off(sec.allow_command_separators && sec.allow_pipe)
      << "\n";
  out << "  sequence (;)    "
      << on_off(sec.allow_command_separators && sec.allow_sequence) << "\n";
  out << "  background (&)  "
      << on_off(sec.allow_command_separators && sec.allow_background) << "\n\n";

  out << "Approvals:\n";
  if (!sec.allow_user_confirmation) {
    out << "  user confirmation is disabled; permitted commands run directly\n";
  } else {
    out << "  approve_command_type(type, session_id, remember) approves write or system\n";
    out << "  commands for the session (remember=true) or for the next command only.\n";
    out << "  approve_command(command, session_id) approves one exact command string.\n";
    out << "  Approvals expire after " << sec.session_timeout_secs
        << "s of session inactivity.\n";
  }
  out << "\nCommands time out after " << sec.command_timeout_secs
      << "s; output is capped at " << std::min(sec.max_output_size, config.output.max_size)
      << " bytes.\n";
  out << "Commands longer than " << sec.max_command_length << " characters are rejected.\n";
  return out.str();
}

common::Result<std::string> CommandService::approval_session(const std::string &session_id) const {
  if (!common::trim(session_id).empty()) {
    return common::Result<std::string>::success(common::trim(session_id));
  }
  if (store_->snapshot()->config.security.require_session_id) {
    return common::Result<std::string>::failure(common::ErrorCode::InvalidArgument,
                                                "a session id is required to approve commands");
  }
  return common::Result<std::string>::success(sessions::ANONYMOUS_SESSION_ID);
}

common::Result<ApprovalResponse>
CommandService::approve_command_type(const std::string &command_type,
                                     const std::string &session_id, const bool remember) {
  auto category = security::category_from_string(command_type);
  if (!category.ok() || category.value() == security::Category::Blocked ||
      category.value() == security::Category::Unrecognized) {
    return common::Result<ApprovalResponse>::failure(
        common::ErrorCode::InvalidArgument,
        "invalid command type '" + command_type + "', expected read, write or system");
  }
  auto session = approval_session(session_id);
  if (!session.ok()) {
    return common::Result<ApprovalResponse>::failure(session.status());
  }

  ApprovalResponse response;
  response.session_id = session.value();
  response.scope = security::category_to_string(category.value());
  response.remember = remember;
  response.success = true;

  if (category.value() == security::Category::Read) {
    response.message = "read commands never need approval";
    return common::Result<ApprovalResponse>::success(std::move(response));
  }

  const auto status = remember ? sessions_.approve(response.session_id, category.value())
                               : sessions_.grant_once(response.session_id, category.value());
  if (!status.ok()) {
    return common::Result<ApprovalResponse>::failure(status);
  }
  observability::record_approval(response.session_id, response.scope, remember);
  response.message = remember ? response.scope + " commands approved for this session"
                              : response.scope + " commands approved for the next command";
  return common::Result<ApprovalResponse>::success(std::move(response));
}

common::Result<ApprovalResponse> CommandService::approve_command(const std::string &command,
                                                                 const std::string &session_id) {
  if (common::trim(command).empty()) {
    return common::Result<ApprovalResponse>::failure(common::ErrorCode::InvalidArgument,
                                                     "command must not be empty");
  }
  auto session = approval_session(session_id);
  if (!session.ok()) {
    return common::Result<ApprovalResponse>::failure(session.status());
  }

  sessions_.approve_command(session.value(), command);
  observability::record_approval(session.value(), common::trim(command), true);

  ApprovalResponse response;
  response.success = true;
  response.session_id = session.value();
  response.scope = common::trim(command);
  response.remember = true;
  response.message = "command approved for this session";
  return common::Result<ApprovalResponse>::success(std::move(response));
}

ConfigurationView CommandService::get_configuration() const {
  const auto snapshot = store_->snapshot();
  return ConfigurationView{.version = snapshot->version,
                           .config = snapshot->config,
                           .warnings = snapshot->warnings,
                           .persisted_to = std::nullopt};
}

common::Result<ConfigurationView>
CommandService::update_configuration(const std::vector<config::Assignment> &assignments,
                                     const bool persist) {
  if (assignments.empty()) {
    return common::Result<ConfigurationView>::failure(common::ErrorCode::InvalidArgument,
                                                      "no configuration changes given");
  }
  auto overlay = config::overlay_from_assignments(assignments);
  if (!overlay.ok()) {
    return common::Result<ConfigurationView>::failure(overlay.status());
  }
  auto outcome = store_->update(overlay.value(), persist);
  if (!outcome.ok()) {
    return common::Result<ConfigurationView>::failure(outcome.status());
  }

  const auto &snapshot = outcome.value().snapshot;
  ConfigurationView view{.version = snapshot->version,
                         .config = snapshot->config,
                         .warnings = snapshot->warnings,
                         .persisted_to = std::nullopt};
  if (outcome.value().persisted_to.has_value()) {
    view.persisted_to = outcome.value().persisted_to->string();
  }
  return common::Result<ConfigurationView>::success(std::move(view));
}

std::size_t CommandService::purge_expired_sessions() { return sessions_.purge_expired(); }

} // namespace shellguard::service
