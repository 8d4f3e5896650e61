#pragma once

#include "shellguard/config/schema.hpp"
#include "shellguard/config/store.hpp"
#include "shellguard/exec/executor.hpp"
#include "shellguard/observability/observer.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shellguard::testing {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

/// Points HOME at a fresh directory and clears every SHELLGUARD_* variable
/// for the lifetime of the guard.
class TempHome {
public:
  TempHome();
  ~TempHome();

  TempHome(const TempHome &) = delete;
  TempHome &operator=(const TempHome &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::filesystem::path config_dir() const { return path_ / ".shellguard"; }

private:
  std::filesystem::path path_;
  std::vector<std::unique_ptr<EnvGuard>> guards_;
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt);
  ~ConfigOverrideGuard();
};

void write_file(const std::filesystem::path &path, const std::string &content);
[[nodiscard]] std::string read_text(const std::filesystem::path &path);

/// Defaults with logging switched off.
[[nodiscard]] config::Config test_config();
/// Store that never writes to disk unless a test installs its own writer.
[[nodiscard]] std::unique_ptr<config::ConfigStore> make_store(config::Config config = test_config());

struct FakeExecutorState {
  std::mutex mutex;
  std::vector<exec::ExecRequest> requests;
  exec::ExecResult next_result;
  std::optional<common::Status> failure;
};

class FakeExecutor final : public exec::IExecutor {
public:
  explicit FakeExecutor(std::shared_ptr<FakeExecutorState> state);

  [[nodiscard]] common::Result<exec::ExecResult> run(const exec::ExecRequest &request) override;

private:
  std::shared_ptr<FakeExecutorState> state_;
};

struct RecordedEvents {
  std::mutex mutex;
  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;
};

class RecordingObserver final : public observability::IObserver {
public:
  explicit RecordingObserver(std::shared_ptr<RecordedEvents> sink);

  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<RecordedEvents> sink_;
};

/// Installs a recording global observer; clears it on destruction.
class ObserverGuard {
public:
  ObserverGuard();
  ~ObserverGuard();

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

private:
  std::shared_ptr<RecordedEvents> sink_;
};

} // namespace shellguard::testing
