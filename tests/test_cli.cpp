#include "test_framework.hpp"

#include "shellguard/cli/commands.hpp"
#include "shellguard/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <iostream>
#include <sstream>

namespace {

struct CliRun {
  int exit_code = 0;
  std::string out;
  std::string err;
};

class StreamCapture {
public:
  StreamCapture(std::ostream &stream, std::ostringstream &sink)
      : stream_(stream), previous_(stream.rdbuf(sink.rdbuf())) {}
  ~StreamCapture() { stream_.rdbuf(previous_); }

  StreamCapture(const StreamCapture &) = delete;
  StreamCapture &operator=(const StreamCapture &) = delete;

private:
  std::ostream &stream_;
  std::streambuf *previous_;
};

CliRun run(std::vector<std::string> args) {
  args.insert(args.begin(), "shellguard");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }

  std::ostringstream out;
  std::ostringstream err;
  CliRun result;
  {
    const StreamCapture capture_out(std::cout, out);
    const StreamCapture capture_err(std::cerr, err);
    result.exit_code = shellguard::cli::run_cli(static_cast<int>(argv.size()), argv.data());
  }
  result.out = out.str();
  result.err = err.str();
  return result;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

// Quiet, isolated environment for one CLI invocation.
struct CliEnv {
  shellguard::testing::TempHome home;
  shellguard::testing::ConfigOverrideGuard cfg_override;
  shellguard::testing::EnvGuard quiet{"SHELLGUARD_LOG_BACKEND", std::string("none")};
};

} // namespace

void register_cli_tests(std::vector<shellguard::tests::TestCase> &tests) {
  using shellguard::tests::require;

  tests.push_back({"cli_version_and_help", [] {
                     const CliEnv env;
                     const auto version = run({"version"});
                     require(version.exit_code == 0, "version should succeed");
                     require(contains(version.out, "shellguard "), "version text: " + version.out);

                     const auto help = run({"help"});
                     require(help.exit_code == 0, "help should succeed");
                     require(contains(help.out, "check [--session ID]"), "help text: " + help.out);

                     const auto unknown = run({"frobnicate"});
                     require(unknown.exit_code == 1, "unknown subcommand should fail");
                     require(contains(unknown.err, "Unknown command: frobnicate"), unknown.err);
                   }});

  tests.push_back({"cli_check_exit_codes_follow_verdicts", [] {
                     const CliEnv env;
                     const auto approved = run({"check", "ls", "-la"});
                     require(approved.exit_code == 0, "approved should exit 0");
                     require(contains(approved.out, "\"verdict\":\"approved\""), approved.out);

                     const auto pending = run({"check", "mkdir", "out"});
                     require(pending.exit_code == 2, "approval needed should exit 2");
                     require(contains(pending.out, "\"command_types\":[\"write\"]"), pending.out);

                     const auto rejected = run({"check", "sudo reboot"});
                     require(rejected.exit_code == 1, "rejected should exit 1");
                     require(contains(rejected.out, "command not permitted: sudo"), rejected.out);
                   }});

  tests.push_back({"cli_check_session_option", [] {
                     const CliEnv env;
                     const auto result = run({"check", "--session", "abc", "--", "ls"});
                     require(result.exit_code == 0, "check should pass");
                     require(contains(result.out, "\"session_id\":\"abc\""), result.out);

                     const auto missing = run({"check"});
                     require(missing.exit_code == 1, "missing command should fail");
                     require(contains(missing.err, "usage: shellguard check"), missing.err);
                   }});

  tests.push_back({"cli_list_prints_categories", [] {
                     const CliEnv env;
                     const auto result = run({"list"});
                     require(result.exit_code == 0, "list should succeed");
                     require(contains(result.out, "read:    ls pwd"), result.out);
                     require(contains(result.out, "blocked: sudo su"), result.out);
                   }});

  tests.push_back({"cli_config_set_persists_to_config_flag_file", [] {
                     const CliEnv env;
                     const auto target = env.home.path() / "cli.toml";

                     const auto set = run({"--config", target.string(), "config", "set",
                                           "commands.read", "awk,jq"});
                     require(set.exit_code == 0, "config set should succeed: " + set.err);
                     require(contains(set.out, "saved " + target.string()), set.out);
                     require(std::filesystem::exists(target), "config file should be written");

                     const auto get = run({"--config=" + target.string(), "config", "get",
                                           "commands.read"});
                     require(get.exit_code == 0, "config get should succeed: " + get.err);
                     require(contains(get.out, "awk,jq"), "persisted list should be read back: " + get.out);

                     const auto check = run({"--config", target.string(), "check", "jq", ".", "x.json"});
                     require(check.exit_code == 0, "new read command should be approved");
                   }});

  tests.push_back({"cli_config_errors", [] {
                     const CliEnv env;
                     const auto unknown_key = run({"config", "get", "server.port"});
                     require(unknown_key.exit_code == 1, "unknown key should fail");
                     require(contains(unknown_key.err, "unknown configuration key"), unknown_key.err);

                     const auto bad_value = run({"config", "set", "security.allow_pipe", "maybe"});
                     require(bad_value.exit_code == 1, "bad value should fail");

                     const auto missing_flag = run({"--config"});
                     require(missing_flag.exit_code == 1, "missing --config value should fail");

                     const auto path = run({"config", "path"});
                     require(path.exit_code == 0, "config path should succeed");
                     require(contains(path.out, ".shellguard/config.toml"), path.out);
                   }});

  tests.push_back({"cli_run_prints_command_output", [] {
                     const CliEnv env;
                     const auto result = run({"run", "ls", "-d", "/"});
                     require(result.exit_code == 0, "ls should succeed: " + result.err);
                     require(result.out == "/\n", "text output expected: " + result.out);

                     const auto pending = run({"run", "touch", "never-created"});
                     require(pending.exit_code == 2, "write should need approval");
                     require(contains(pending.out, "\"requires_approval\":true"), pending.out);
                     require(!std::filesystem::exists("never-created"), "nothing should run");
                   }});

  tests.push_back({"cli_broken_config_reports_error", [] {
                     const CliEnv env;
                     const auto path = shellguard::config::config_path();
                     require(path.ok(), path.error());
                     shellguard::testing::write_file(path.value(), "[security]\nsession_timeout = 0\n");
                     const auto result = run({"check", "ls"});
                     require(result.exit_code == 1, "invalid config should fail");
                     require(contains(result.err, "security.session_timeout"), result.err);
                   }});
}
