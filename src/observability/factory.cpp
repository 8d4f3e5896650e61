#include "shellguard/observability/factory.hpp"

#include "shellguard/common/fs.hpp"
#include "shellguard/observability/log_observer.hpp"
#include "shellguard/observability/noop_observer.hpp"

namespace shellguard::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.server.log_backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  const auto level = log_level_from_string(config.server.log_level);
  return std::make_unique<LogObserver>(level.ok() ? level.value() : LogLevel::Info);
}

} // namespace shellguard::observability
