#pragma once

#include "shellguard/config/schema.hpp"
#include "shellguard/security/decision_engine.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shellguard::service {

struct CommandResponse {
  std::string verdict;
  bool success = false;
  std::string output;
  std::string error;
  std::optional<std::string> error_code;
  std::optional<int> exit_code;
  bool requires_approval = false;
  std::vector<std::string> command_types;
  std::string session_id;
  std::optional<std::size_t> segment_index;
  bool background = false;
  bool truncated = false;
  bool timed_out = false;

  [[nodiscard]] std::string to_json() const;
};

struct CommandLists {
  std::vector<std::string> read_commands;
  std::vector<std::string> write_commands;
  std::vector<std::string> system_commands;
  std::vector<std::string> blocked_commands;

  [[nodiscard]] std::string to_json() const;
};

struct ApprovalResponse {
  bool success = false;
  std::string message;
  std::string session_id;
  std::string scope;
  bool remember = false;

  [[nodiscard]] std::string to_json() const;
};

struct ConfigurationView {
  std::uint64_t version = 0;
  config::Config config;
  std::vector<std::string> warnings;
  std::optional<std::string> persisted_to;

  [[nodiscard]] std::string to_json() const;
};

[[nodiscard]] std::string decision_to_json(const security::Decision &decision);
[[nodiscard]] std::string error_to_json(const common::Status &status);

} // namespace shellguard::service
