#include "bench_common.hpp"

#include "shellguard/config/config.hpp"
#include "shellguard/config/store.hpp"

void run_config_benchmark() {
  shellguard::bench::run_bench("config_validate", 2000, [] {
    shellguard::config::Config config;
    (void)shellguard::config::validate_config(config);
  });

  shellguard::bench::run_bench("config_build_snapshot", 500, [] {
    (void)shellguard::config::build_snapshot(shellguard::config::Config{}, 1);
  });

  const std::string rendered = shellguard::config::render_config_toml(shellguard::config::Config{});
  shellguard::bench::run_bench("config_parse_toml", 2000, [&rendered] {
    auto doc = shellguard::common::parse_toml(rendered);
    if (doc.ok()) {
      (void)shellguard::config::overlay_from_toml(doc.value());
    }
  });
}
