#include "tests/helpers/test_helpers.hpp"

#include "shellguard/config/config.hpp"
#include "shellguard/observability/global.hpp"

#include <array>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace shellguard::testing {

namespace {

constexpr std::array<const char *, 21> kShellguardEnv = {
    "SHELLGUARD_CONFIG",
    "SHELLGUARD_ENV_FILE",
    "SHELLGUARD_LOG_LEVEL",
    "SHELLGUARD_LOG_BACKEND",
    "SHELLGUARD_SESSION_TIMEOUT",
    "SHELLGUARD_COMMAND_TIMEOUT",
    "SHELLGUARD_MAX_OUTPUT_SIZE",
    "SHELLGUARD_MAX_COMMAND_LENGTH",
    "SHELLGUARD_ALLOW_USER_CONFIRMATION",
    "SHELLGUARD_REQUIRE_SESSION_ID",
    "SHELLGUARD_ALLOW_COMMAND_SEPARATORS",
    "SHELLGUARD_ALLOW_PIPE",
    "SHELLGUARD_ALLOW_SEQUENCE",
    "SHELLGUARD_ALLOW_BACKGROUND",
    "SHELLGUARD_ALLOW_UNRECOGNIZED_COMMANDS",
    "SHELLGUARD_READ_COMMANDS",
    "SHELLGUARD_WRITE_COMMANDS",
    "SHELLGUARD_SYSTEM_COMMANDS",
    "SHELLGUARD_BLOCKED_COMMANDS",
    "SHELLGUARD_OUTPUT_MAX_SIZE",
    "SHELLGUARD_OUTPUT_FORMAT",
};

} // namespace

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = std::string(existing);
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

TempHome::TempHome() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("shellguard-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
  guards_.push_back(std::make_unique<EnvGuard>("HOME", path_.string()));
  for (const char *name : kShellguardEnv) {
    guards_.push_back(std::make_unique<EnvGuard>(name, std::nullopt));
  }
}

TempHome::~TempHome() {
  guards_.clear();
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

ConfigOverrideGuard::ConfigOverrideGuard(std::optional<std::filesystem::path> next) {
  old_override = config::config_path_override();
  if (next.has_value()) {
    config::set_config_path_override(*next);
  } else {
    config::clear_config_path_override();
  }
}

ConfigOverrideGuard::~ConfigOverrideGuard() {
  if (old_override.has_value()) {
    config::set_config_path_override(*old_override);
  } else {
    config::clear_config_path_override();
  }
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

std::string read_text(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

config::Config test_config() {
  config::Config config;
  config.server.log_backend = "none";
  return config;
}

std::unique_ptr<config::ConfigStore> make_store(config::Config config) {
  auto store = config::ConfigStore::create(std::move(config));
  if (!store.ok()) {
    throw std::runtime_error("failed to build config store: " + store.error());
  }
  store.value()->set_persist_fn([](const config::Config &) { return common::Status::success(); });
  return std::move(store.value());
}

FakeExecutor::FakeExecutor(std::shared_ptr<FakeExecutorState> state) : state_(std::move(state)) {}

common::Result<exec::ExecResult> FakeExecutor::run(const exec::ExecRequest &request) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->requests.push_back(request);
  if (state_->failure.has_value()) {
    return common::Result<exec::ExecResult>::failure(*state_->failure);
  }
  return common::Result<exec::ExecResult>::success(state_->next_result);
}

RecordingObserver::RecordingObserver(std::shared_ptr<RecordedEvents> sink)
    : sink_(std::move(sink)) {}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(sink_->mutex);
  sink_->events.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(sink_->mutex);
  sink_->metrics.push_back(metric);
}

ObserverGuard::ObserverGuard() : sink_(std::make_shared<RecordedEvents>()) {
  observability::set_global_observer(std::make_unique<RecordingObserver>(sink_));
}

ObserverGuard::~ObserverGuard() { observability::set_global_observer(nullptr); }

std::vector<observability::ObserverEvent> ObserverGuard::events() const {
  std::lock_guard<std::mutex> lock(sink_->mutex);
  return sink_->events;
}

std::vector<observability::ObserverMetric> ObserverGuard::metrics() const {
  std::lock_guard<std::mutex> lock(sink_->mutex);
  return sink_->metrics;
}

} // namespace shellguard::testing
