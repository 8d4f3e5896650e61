#include "bench_common.hpp"

#include "shellguard/config/store.hpp"
#include "shellguard/security/command_parser.hpp"
#include "shellguard/security/decision_engine.hpp"
#include "shellguard/sessions/session_manager.hpp"

#include <iostream>

void run_decision_benchmark() {
  namespace sg = shellguard;

  shellguard::bench::run_bench("parse_pipeline", 20000, [] {
    (void)sg::security::parse_command_line(R"(find . -name "*.cpp" | grep -v build | sort; ls -la)");
  });

  sg::config::Config config;
  config.server.log_backend = "none";
  auto store = sg::config::ConfigStore::create(config);
  if (!store.ok()) {
    std::cerr << "decision benchmark skipped: " << store.error() << "\n";
    return;
  }
  sg::sessions::SessionManager sessions(std::chrono::seconds(3600));
  sg::security::DecisionEngine engine(*store.value(), sessions);

  shellguard::bench::run_bench("evaluate_read_pipeline", 5000, [&engine] {
    (void)engine.evaluate({.command = "ls -la | grep foo | sort", .session_id = "bench"});
  });
  shellguard::bench::run_bench("evaluate_dangerous", 5000, [&engine] {
    (void)engine.evaluate({.command = "cat notes.txt; rm -rf /", .session_id = "bench"});
  });
  shellguard::bench::run_bench("evaluate_needs_approval", 5000, [&engine] {
    (void)engine.evaluate({.command = "mkdir out; touch out/file", .session_id = "bench"});
  });
}
