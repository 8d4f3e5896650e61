#include "test_framework.hpp"

#include "shellguard/service/stdio_server.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <sstream>

namespace {

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

std::vector<std::string> lines_of(const std::string &text) {
  std::vector<std::string> out;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    out.push_back(line);
  }
  return out;
}

std::unique_ptr<shellguard::service::CommandService> make_service() {
  return std::make_unique<shellguard::service::CommandService>(
      shellguard::testing::make_store(), std::make_unique<shellguard::exec::ShellExecutor>());
}

} // namespace

void register_stdio_integration_tests(std::vector<shellguard::tests::TestCase> &tests) {
  using shellguard::tests::require;

  tests.push_back({"stdio_approval_flow_end_to_end", [] {
                     const shellguard::testing::TempHome home;
                     const auto dir = (home.path() / "made").string();
                     auto service = make_service();
                     shellguard::service::StdioServer server(*service);

                     std::istringstream in("CHECK\tagent\tls -la | grep foo\n"
                                           "EXEC\tagent\tmkdir " + dir + "\n"
                                           "APPROVE\tagent\twrite\ttrue\n"
                                           "EXEC\tagent\tmkdir " + dir + "\n"
                                           "EXEC_READ\tls " + home.path().string() + "\n"
                                           "\n"
                                           "QUIT\n"
                                           "LIST\n");
                     std::ostringstream out;
                     require(server.run(in, out) == 0, "server should exit cleanly");

                     const auto responses = lines_of(out.str());
                     require(responses.size() == 5, "one response per request before QUIT: " + out.str());
                     require(contains(responses[0], "\"verdict\":\"approved\""), responses[0]);
                     require(contains(responses[1], "\"requires_approval\":true"), responses[1]);
                     require(contains(responses[1], "\"session_id\":\"agent\""), responses[1]);
                     require(contains(responses[2], "\"success\":true"), responses[2]);
                     require(contains(responses[3], "\"verdict\":\"approved\""), responses[3]);
                     require(contains(responses[3], "\"exit_code\":0"), responses[3]);
                     require(std::filesystem::is_directory(dir), "approved mkdir should have run");
                     require(contains(responses[4], "made"), "read listing should show the dir: " +
                                                                  responses[4]);
                   }});

  tests.push_back({"stdio_rejections_and_errors", [] {
                     auto service = make_service();
                     shellguard::service::StdioServer server(*service);

                     const auto rejected = server.handle_line("EXEC\t\tcat f; sudo reboot");
                     require(contains(rejected, "\"verdict\":\"rejected\""), rejected);
                     require(contains(rejected, "\"segment_index\":1"), rejected);
                     require(contains(rejected, "\"session_id\":\"anonymous\""), rejected);

                     const auto unknown = server.handle_line("DANCE");
                     require(contains(unknown, "\"ok\":false"), unknown);
                     require(contains(unknown, "unknown request: DANCE"), unknown);

                     const auto usage = server.handle_line("CHECK\tonly-session");
                     require(contains(usage, "\"error_code\":\"invalid_argument\""), usage);

                     const auto bad_type = server.handle_line("APPROVE\ts\tblocked\ttrue");
                     require(contains(bad_type, "\"ok\":false"), bad_type);

                     const auto bad_bool = server.handle_line("APPROVE\ts\twrite\tmaybe");
                     require(contains(bad_bool, "\"error_code\":\"invalid_argument\""), bad_bool);
                   }});

  tests.push_back({"stdio_command_field_keeps_tabs", [] {
                     auto service = make_service();
                     shellguard::service::StdioServer server(*service);

                     const auto check = server.handle_line("CHECK\t\tgrep\tfoo notes.txt");
                     require(contains(check, "\"verdict\":\"approved\""), check);
                     require(contains(check, "\"text\":\"grep\\tfoo notes.txt\""), check);

                     const auto exec = server.handle_line("EXEC\tagent\tcat\t/nonexistent-shellguard");
                     require(contains(exec, "\"verdict\":\"approved\""), exec);
                     require(contains(exec, "\"exit_code\":1"), exec);
                   }});

  tests.push_back({"stdio_config_and_catalog_requests", [] {
                     auto service = make_service();
                     shellguard::service::StdioServer server(*service);

                     const auto list = server.handle_line("LIST");
                     require(contains(list, "\"blocked\":[\"sudo\""), list);

                     const auto help = server.handle_line("HELP\r");
                     require(contains(help, "\"help\":\"shellguard"), help);

                     const auto set = server.handle_line("CONFIG_SET\tcommands.read\tjq\tfalse");
                     require(contains(set, "\"version\":2"), set);
                     require(!contains(set, "persisted_to"), set);

                     const auto get = server.handle_line("CONFIG_GET");
                     require(contains(get, "\"version\":2"), get);
                     require(contains(get, "\"jq\""), get);

                     const auto check = server.handle_line("CHECK\t\tjq . data.json");
                     require(contains(check, "\"verdict\":\"approved\""), check);

                     const auto bad_key = server.handle_line("CONFIG_SET\tserver.port\t8080");
                     require(contains(bad_key, "\"error_code\":\"configuration_error\""), bad_key);
                   }});

  tests.push_back({"stdio_exact_command_approval", [] {
                     const shellguard::testing::TempHome home;
                     const auto file = (home.path() / "note.txt").string();
                     auto service = make_service();
                     shellguard::service::StdioServer server(*service);

                     const std::string command = "touch " + file;
                     const auto approve = server.handle_line("APPROVE_COMMAND\tagent\t" + command);
                     require(contains(approve, "\"success\":true"), approve);
                     const auto run = server.handle_line("EXEC\tagent\t" + command);
                     require(contains(run, "\"exit_code\":0"), run);
                     require(std::filesystem::exists(file), "approved command should have run");
                   }});
}
