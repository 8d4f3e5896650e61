#pragma once

#include "shellguard/service/command_service.hpp"

#include <iosfwd>
#include <string>

namespace shellguard::service {

/// Line protocol over a pair of streams: one tab-separated request per line,
/// one JSON object per response line.
///
///   CHECK\t<session>\t<command>
///   EXEC\t<session>\t<command>
///   EXEC_READ\t<command>
///   APPROVE\t<session>\t<type>\t<remember>
///   APPROVE_COMMAND\t<session>\t<command>
///   LIST
///   HELP
///   CONFIG_GET
///   CONFIG_SET\t<key>\t<value>\t<persist>
///
/// A <command> field runs to the end of the line, tabs included.
class StdioServer {
public:
  explicit StdioServer(CommandService &service);

  /// Serves until EOF or a QUIT line.
  int run(std::istream &in, std::ostream &out);

  [[nodiscard]] std::string handle_line(const std::string &line);

private:
  CommandService &service_;
};

} // namespace shellguard::service
