#pragma once

#include "shellguard/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace shellguard::exec {

inline constexpr const char *TRUNCATION_NOTICE = "\n... [output truncated due to size]";

struct ExecRequest {
  std::string command;
  /// The whole line is a background job: launch it with output discarded.
  bool background = false;
  std::chrono::seconds timeout{30};
  std::size_t output_cap = 100 * 1024;
  std::filesystem::path working_dir;
};

struct ExecResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = 0;
  bool timed_out = false;
  bool truncated = false;
  std::chrono::milliseconds duration{0};

  [[nodiscard]] bool success() const { return !timed_out && exit_code == 0; }
};

class IExecutor {
public:
  virtual ~IExecutor() = default;

  [[nodiscard]] virtual common::Result<ExecResult> run(const ExecRequest &request) = 0;
};

/// Runs commands through `/bin/sh -c` in a forked child.
class ShellExecutor final : public IExecutor {
public:
  [[nodiscard]] common::Result<ExecResult> run(const ExecRequest &request) override;

private:
  [[nodiscard]] common::Result<ExecResult> run_foreground(const ExecRequest &request);
  [[nodiscard]] common::Result<ExecResult> run_background(const ExecRequest &request);
};

/// Caps `text` at `cap` bytes, appending the truncation notice when cut.
[[nodiscard]] std::string truncate_output(const std::string &text, std::size_t cap,
                                          bool *truncated = nullptr);

} // namespace shellguard::exec
