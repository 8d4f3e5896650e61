#pragma once

#include "shellguard/common/result.hpp"
#include "shellguard/config/config.hpp"
#include "shellguard/config/store.hpp"
#include "shellguard/exec/executor.hpp"
#include "shellguard/security/decision_engine.hpp"
#include "shellguard/service/responses.hpp"
#include "shellguard/sessions/session_manager.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shellguard::service {

/// Tool surface offered to the assistant: evaluate, execute, approve and
/// inspect or update configuration.
class CommandService {
public:
  CommandService(std::unique_ptr<config::ConfigStore> store,
                 std::unique_ptr<exec::IExecutor> executor);

  [[nodiscard]] common::Result<security::Decision>
  check(const std::string &command, const std::optional<std::string> &session_id = std::nullopt);

  [[nodiscard]] common::Result<CommandResponse>
  execute_command(const std::string &command,
                  const std::optional<std::string> &session_id = std::nullopt);

  /// Runs only commands whose every segment is a read command.
  [[nodiscard]] common::Result<CommandResponse> execute_read_command(const std::string &command);

  [[nodiscard]] CommandLists list_available_commands() const;
  [[nodiscard]] std::string get_command_help() const;

  [[nodiscard]] common::Result<ApprovalResponse>
  approve_command_type(const std::string &command_type, const std::string &session_id,
                       bool remember);
  [[nodiscard]] common::Result<ApprovalResponse> approve_command(const std::string &command,
                                                                 const std::string &session_id);

  [[nodiscard]] ConfigurationView get_configuration() const;
  [[nodiscard]] common::Result<ConfigurationView>
  update_configuration(const std::vector<config::Assignment> &assignments, bool persist);

  std::size_t purge_expired_sessions();

  [[nodiscard]] config::ConfigStore &store() { return *store_; }
  [[nodiscard]] sessions::SessionManager &sessions() { return sessions_; }

private:
  [[nodiscard]] common::Result<CommandResponse> run_approved(const security::Decision &decision,
                                                             const std::string &command);
  [[nodiscard]] common::Result<std::string>
  approval_session(const std::string &session_id) const;

  std::unique_ptr<config::ConfigStore> store_;
  sessions::SessionManager sessions_;
  security::DecisionEngine engine_;
  std::unique_ptr<exec::IExecutor> executor_;
};

} // namespace shellguard::service
