#include "shellguard/service/stdio_server.hpp"

#include "shellguard/common/fs.hpp"
#include "shellguard/common/json_util.hpp"

#include <iostream>
#include <sstream>
#include <vector>

namespace shellguard::service {

namespace {

std::vector<std::string> split_fields(const std::string &line) {
  std::vector<std::string> fields;
  std::string current;
  std::istringstream stream(line);
  while (std::getline(stream, current, '\t')) {
    fields.push_back(current);
  }
  if (!line.empty() && line.back() == '\t') {
    fields.emplace_back();
  }
  return fields;
}

// The command is the last field and may itself contain tabs.
std::string command_field(const std::vector<std::string> &fields, const std::size_t start) {
  std::string command = fields[start];
  for (std::size_t i = start + 1; i < fields.size(); ++i) {
    command += '\t';
    command += fields[i];
  }
  return command;
}

std::optional<std::string> optional_session(const std::string &value) {
  const std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::string usage_error(const std::string &usage) {
  return error_to_json(
      common::Status::error(common::ErrorCode::InvalidArgument, "usage: " + usage));
}

template <typename T> std::string render(const common::Result<T> &result) {
  if (!result.ok()) {
    return error_to_json(result.status());
  }
  return result.value().to_json();
}

} // namespace

StdioServer::StdioServer(CommandService &service) : service_(service) {}

std::string StdioServer::handle_line(const std::string &line) {
  std::string trimmed_line = line;
  if (!trimmed_line.empty() && trimmed_line.back() == '\r') {
    trimmed_line.pop_back();
  }
  const auto fields = split_fields(trimmed_line);
  if (fields.empty()) {
    return usage_error("<VERB>\\t<args...>");
  }
  const std::string verb = common::trim(fields[0]);

  if (verb == "CHECK") {
    if (fields.size() < 3) {
      return usage_error("CHECK\\t<session>\\t<command>");
    }
    auto decision = service_.check(command_field(fields, 2), optional_session(fields[1]));
    if (!decision.ok()) {
      return error_to_json(decision.status());
    }
    return decision_to_json(decision.value());
  }
  if (verb == "EXEC") {
    if (fields.size() < 3) {
      return usage_error("EXEC\\t<session>\\t<command>");
    }
    return render(service_.execute_command(command_field(fields, 2), optional_session(fields[1])));
  }
  if (verb == "EXEC_READ") {
    if (fields.size() < 2) {
      return usage_error("EXEC_READ\\t<command>");
    }
    return render(service_.execute_read_command(command_field(fields, 1)));
  }
  if (verb == "APPROVE") {
    if (fields.size() < 3) {
      return usage_error("APPROVE\\t<session>\\t<type>\\t<remember>");
    }
    bool remember = true;
    if (fields.size() >= 4 && !common::trim(fields[3]).empty()) {
      auto parsed = common::parse_bool(fields[3]);
      if (!parsed.ok()) {
        return error_to_json(
            common::Status::error(common::ErrorCode::InvalidArgument, parsed.error()));
      }
      remember = parsed.value();
    }
    return render(service_.approve_command_type(fields[2], fields[1], remember));
  }
  if (verb == "APPROVE_COMMAND") {
    if (fields.size() < 3) {
      return usage_error("APPROVE_COMMAND\\t<session>\\t<command>");
    }
    return render(service_.approve_command(command_field(fields, 2), fields[1]));
  }
  if (verb == "LIST") {
    return service_.list_available_commands().to_json();
  }
  if (verb == "HELP") {
    common::JsonObjectWriter writer;
    writer.field("ok", true).field("help", service_.get_command_help());
    return writer.str();
  }
  if (verb == "CONFIG_GET") {
    return service_.get_configuration().to_json();
  }
  if (verb == "CONFIG_SET") {
    if (fields.size() < 3) {
      return usage_error("CONFIG_SET\\t<key>\\t<value>\\t<persist>");
    }
    bool persist = false;
    if (fields.size() >= 4 && !common::trim(fields[3]).empty()) {
      auto parsed = common::parse_bool(fields[3]);
      if (!parsed.ok()) {
        return error_to_json(
            common::Status::error(common::ErrorCode::InvalidArgument, parsed.error()));
      }
      persist = parsed.value();
    }
    return render(service_.update_configuration({{fields[1], fields[2]}}, persist));
  }

  return error_to_json(
      common::Status::error(common::ErrorCode::InvalidArgument, "unknown request: " + verb));
}

int StdioServer::run(std::istream &in, std::ostream &out) {
  std::string line;
  while (std::getline(in, line)) {
    if (common::trim(line).empty()) {
      continue;
    }
    if (common::trim(line) == "QUIT") {
      break;
    }
    service_.purge_expired_sessions();
    out << handle_line(line) << "\n";
    out.flush();
  }
  return 0;
}

} // namespace shellguard::service
