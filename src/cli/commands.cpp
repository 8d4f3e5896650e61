#include "shellguard/cli/commands.hpp"

#include "shellguard/common/fs.hpp"
#include "shellguard/config/config.hpp"
#include "shellguard/config/store.hpp"
#include "shellguard/exec/executor.hpp"
#include "shellguard/observability/factory.hpp"
#include "shellguard/observability/global.hpp"
#include "shellguard/service/command_service.hpp"
#include "shellguard/service/stdio_server.hpp"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace shellguard::cli {

namespace {

constexpr int EXIT_REJECTED = 1;
constexpr int EXIT_NEEDS_APPROVAL = 2;

std::string version_string() {
#ifdef SHELLGUARD_VERSION
  return std::string("shellguard ") + SHELLGUARD_VERSION;
#else
  return "shellguard 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == long_name || args[i] == short_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

void drop_separator(std::vector<std::string> &args) {
  if (!args.empty() && args.front() == "--") {
    args.erase(args.begin());
  }
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--") {
      break;
    }
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

common::Result<std::unique_ptr<service::CommandService>> make_service() {
  auto store = config::ConfigStore::load();
  if (!store.ok()) {
    return common::Result<std::unique_ptr<service::CommandService>>::failure(store.status());
  }
  observability::set_global_observer(
      observability::create_observer(store.value()->snapshot()->config));
  return common::Result<std::unique_ptr<service::CommandService>>::success(
      std::make_unique<service::CommandService>(std::move(store.value()),
                                                std::make_unique<exec::ShellExecutor>()));
}

int report_error(const common::Status &status) {
  std::cerr << "error: " << status.error() << "\n";
  return 1;
}

int run_check(std::vector<std::string> args) {
  std::string session;
  const bool has_session = take_option(args, "--session", "-s", session);
  drop_separator(args);
  const std::string command = join_tokens(args);
  if (common::trim(command).empty()) {
    std::cerr << "usage: shellguard check [--session ID] <command...>\n";
    return 1;
  }

  auto svc = make_service();
  if (!svc.ok()) {
    return report_error(svc.status());
  }
  auto decision = svc.value()->check(
      command, has_session ? std::optional<std::string>(session) : std::nullopt);
  if (!decision.ok()) {
    return report_error(decision.status());
  }
  std::cout << service::decision_to_json(decision.value()) << "\n";

  if (security::is_approved(decision.value().verdict)) {
    return 0;
  }
  return std::holds_alternative<security::RequiresApproval>(decision.value().verdict)
             ? EXIT_NEEDS_APPROVAL
             : EXIT_REJECTED;
}

int run_command(std::vector<std::string> args) {
  std::string session;
  const bool has_session = take_option(args, "--session", "-s", session);
  drop_separator(args);
  const std::string command = join_tokens(args);
  if (common::trim(command).empty()) {
    std::cerr << "usage: shellguard run [--session ID] <command...>\n";
    return 1;
  }

  auto svc = make_service();
  if (!svc.ok()) {
    return report_error(svc.status());
  }
  auto response = svc.value()->execute_command(
      command, has_session ? std::optional<std::string>(session) : std::nullopt);
  if (!response.ok()) {
    return report_error(response.status());
  }

  const auto &value = response.value();
  const bool text_output =
      common::to_lower(svc.value()->get_configuration().config.output.format) == "text";
  if (text_output && value.verdict == "approved") {
    std::cout << value.output;
    std::cerr << value.error;
    return value.exit_code.value_or(1);
  }
  std::cout << value.to_json() << "\n";
  if (value.requires_approval) {
    return EXIT_NEEDS_APPROVAL;
  }
  return value.success ? 0 : EXIT_REJECTED;
}

int run_list() {
  auto svc = make_service();
  if (!svc.ok()) {
    return report_error(svc.status());
  }
  const auto lists = svc.value()->list_available_commands();
  std::cout << "read:    " << common::join(lists.read_commands, " ") << "\n";
  std::cout << "write:   " << common::join(lists.write_commands, " ") << "\n";
  std::cout << "system:  " << common::join(lists.system_commands, " ") << "\n";
  std::cout << "blocked: " << common::join(lists.blocked_commands, " ") << "\n";
  return 0;
}

int run_help_commands() {
  auto svc = make_service();
  if (!svc.ok()) {
    return report_error(svc.status());
  }
  std::cout << svc.value()->get_command_help();
  return 0;
}

int run_serve() {
  auto svc = make_service();
  if (!svc.ok()) {
    return report_error(svc.status());
  }
  service::StdioServer server(*svc.value());
  return server.run(std::cin, std::cout);
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      return report_error(path_result.status());
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return report_error(cfg.status());
  }

  if (args.empty() || args[0] == "show") {
    std::cout << config::render_config_toml(cfg.value());
    return 0;
  }

  if (args[0] == "get") {
    if (args.size() < 2) {
      std::cerr << "usage: shellguard config get <key>\n";
      std::cerr << "keys: " << common::join(config::config_keys(), ", ") << "\n";
      return 1;
    }
    auto value = config::get_config_value(cfg.value(), args[1]);
    if (!value.ok()) {
      return report_error(value.status());
    }
    std::cout << value.value() << "\n";
    return 0;
  }

  if (args[0] == "set") {
    if (args.size() < 3) {
      std::cerr << "usage: shellguard config set <key> <value>\n";
      return 1;
    }
    auto store = config::ConfigStore::create(std::move(cfg.value()));
    if (!store.ok()) {
      return report_error(store.status());
    }
    auto overlay = config::overlay_from_assignments({{args[1], join_tokens(args, 2)}});
    if (!overlay.ok()) {
      return report_error(overlay.status());
    }
    auto updated = store.value()->update(overlay.value(), true);
    if (!updated.ok()) {
      return report_error(updated.status());
    }
    if (updated.value().persisted_to.has_value()) {
      std::cout << "saved " << updated.value().persisted_to->string() << "\n";
    }
    return 0;
  }

  std::cerr << "unknown config command: " << args[0] << "\n";
  return 1;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  shellguard [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  check [--session ID] <cmd...>  Evaluate a command without running it\n";
  std::cout << "                                 (exit 0 approved, 2 needs approval, 1 rejected)\n";
  std::cout << "  run [--session ID] <cmd...>    Evaluate and run a command\n";
  std::cout << "  list                           Show read/write/system/blocked commands\n";
  std::cout << "  help-commands                  Describe command categories and approvals\n";
  std::cout << "  serve                          Serve the line protocol on stdin/stdout\n";
  std::cout << "  config path|show              Show the config file path or contents\n";
  std::cout << "  config get <key>               Print one setting\n";
  std::cout << "  config set <key> <value>       Update and persist one setting\n";
  std::cout << "  version                        Show version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "check") {
    return run_check(std::move(args));
  }
  if (subcommand == "run") {
    return run_command(std::move(args));
  }
  if (subcommand == "list") {
    return run_list();
  }
  if (subcommand == "help-commands") {
    return run_help_commands();
  }
  if (subcommand == "serve") {
    return run_serve();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace shellguard::cli
