#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shellguard::config {

struct ServerConfig {
  std::string name = "shellguard";
  std::string version = "0.1.0";
  std::string description = "Policy gate for safely executing command-line tools";
  std::string log_level = "info";
  std::string log_backend = "log";
};

struct SecurityConfig {
  std::uint64_t session_timeout_secs = 3600;
  std::uint64_t command_timeout_secs = 30;
  std::uint64_t max_output_size = 100 * 1024;
  std::uint64_t max_command_length = 8192;
  bool allow_user_confirmation = true;
  bool require_session_id = false;
  bool allow_command_separators = true;
  bool allow_pipe = true;
  bool allow_sequence = true;
  bool allow_background = true;
  bool allow_unrecognized_commands = false;
};

struct CommandsConfig {
  std::vector<std::string> read_commands = {
      "ls",     "pwd",      "cat",  "less", "head",   "tail",  "grep", "find",
      "which",  "du",       "df",   "file", "uname",  "hostname", "uptime", "date",
      "whoami", "id",       "env",  "history", "man", "info",  "help", "sort"};
  std::vector<std::string> write_commands = {"cp",    "mv",    "rm",    "mkdir",
                                             "rmdir", "touch", "chmod", "chown",
                                             "ln",    "echo",  "printf"};
  std::vector<std::string> system_commands = {"ps",    "top",  "htop", "who",   "netstat",
                                              "ifconfig", "ping", "ssh", "scp", "tar",
                                              "gzip",  "zip",  "unzip", "curl", "wget"};
  std::vector<std::string> blocked_commands = {
      "sudo",   "su",     "bash",     "sh",       "zsh",     "ksh",      "csh",
      "fish",   "screen", "tmux",     "nc",       "telnet",  "nmap",     "dd",
      "mkfs",   "mount",  "umount",   "shutdown", "reboot",  "passwd",   "chpasswd",
      "useradd", "userdel", "groupadd", "groupdel", "eval",  "exec",     "source",
      "."};
  std::vector<std::string> dangerous_patterns = {
      R"(rm\s+-rf\s+/)",
      R"(>\s+/dev/(sd|hd|nvme|xvd))",
      R"(>\s+/dev/null)",
      R"(>\s+/etc/)",
      R"(>\s+/boot/)",
      R"(>\s+/bin/)",
      R"(>\s+/sbin/)",
      R"(>\s+/usr/bin/)",
      R"(>\s+/usr/sbin/)",
      R"(>\s+/usr/local/bin/)",
      R"(2>&1)",
      R"(\$\()",
      R"(\$\{\w+\})",
      R"(`)"};
};

struct OutputConfig {
  std::uint64_t max_size = 100 * 1024;
  std::string format = "text";
};

struct Config {
  ServerConfig server;
  SecurityConfig security;
  CommandsConfig commands;
  OutputConfig output;
};

/// One configuration layer. Unset scalars leave the lower layer alone; lists
/// are unioned into the lower layer.
struct ConfigOverlay {
  std::optional<std::string> server_name;
  std::optional<std::string> server_version;
  std::optional<std::string> server_description;
  std::optional<std::string> log_level;
  std::optional<std::string> log_backend;

  std::optional<std::uint64_t> session_timeout_secs;
  std::optional<std::uint64_t> command_timeout_secs;
  std::optional<std::uint64_t> max_output_size;
  std::optional<std::uint64_t> max_command_length;
  std::optional<bool> allow_user_confirmation;
  std::optional<bool> require_session_id;
  std::optional<bool> allow_command_separators;
  std::optional<bool> allow_pipe;
  std::optional<bool> allow_sequence;
  std::optional<bool> allow_background;
  std::optional<bool> allow_unrecognized_commands;

  std::vector<std::string> read_commands;
  std::vector<std::string> write_commands;
  std::vector<std::string> system_commands;
  std::vector<std::string> blocked_commands;
  std::vector<std::string> dangerous_patterns;

  std::optional<std::uint64_t> output_max_size;
  std::optional<std::string> output_format;

  [[nodiscard]] bool empty() const;
};

} // namespace shellguard::config
