#include "shellguard/config/store.hpp"

#include "shellguard/observability/global.hpp"

namespace shellguard::config {

common::Result<std::shared_ptr<const ConfigSnapshot>> build_snapshot(Config config,
                                                                     const std::uint64_t version) {
  using SnapshotResult = common::Result<std::shared_ptr<const ConfigSnapshot>>;

  // The matcher compile below is the regex check.
  auto warnings = validate_settings(config);
  if (!warnings.ok()) {
    return SnapshotResult::failure(warnings.status());
  }
  auto matcher = security::PatternMatcher::compile(config.commands.dangerous_patterns);
  if (!matcher.ok()) {
    return SnapshotResult::failure(matcher.status());
  }

  auto snapshot = std::make_shared<ConfigSnapshot>();
  snapshot->version = version;
  snapshot->classifier = security::CommandClassifier(config.commands);
  snapshot->matcher = std::move(matcher.value());
  snapshot->warnings = std::move(warnings.value());
  snapshot->config = std::move(config);
  return SnapshotResult::success(std::move(snapshot));
}

ConfigStore::ConfigStore(std::shared_ptr<const ConfigSnapshot> initial)
    : current_(std::move(initial)),
      persist_([](const Config &config) { return save_config(config); }) {}

common::Result<std::unique_ptr<ConfigStore>> ConfigStore::create(Config initial) {
  auto snapshot = build_snapshot(std::move(initial), 1);
  if (!snapshot.ok()) {
    return common::Result<std::unique_ptr<ConfigStore>>::failure(snapshot.status());
  }
  for (const auto &warning : snapshot.value()->warnings) {
    observability::record_config_warning(warning);
  }
  return common::Result<std::unique_ptr<ConfigStore>>::success(
      std::unique_ptr<ConfigStore>(new ConfigStore(snapshot.value())));
}

common::Result<std::unique_ptr<ConfigStore>> ConfigStore::load() {
  auto config = load_config();
  if (!config.ok()) {
    return common::Result<std::unique_ptr<ConfigStore>>::failure(config.status());
  }
  return create(std::move(config.value()));
}

std::shared_ptr<const ConfigSnapshot> ConfigStore::snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return current_;
}

common::Result<UpdateOutcome> ConfigStore::update(const ConfigOverlay &overlay,
                                                  const bool persist) {
  std::lock_guard<std::mutex> update_lock(update_mutex_);

  const auto base = snapshot();
  Config merged = base->config;
  apply_overlay(merged, overlay);

  auto next = build_snapshot(std::move(merged), base->version + 1);
  if (!next.ok()) {
    return common::Result<UpdateOutcome>::failure(next.status());
  }

  UpdateOutcome outcome;
  outcome.snapshot = next.value();
  if (persist) {
    if (auto status = persist_(outcome.snapshot->config); !status.ok()) {
      return common::Result<UpdateOutcome>::failure(status);
    }
    if (auto path = config_path(); path.ok()) {
      outcome.persisted_to = path.value();
    }
  }

  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    current_ = outcome.snapshot;
  }

  for (const auto &warning : outcome.snapshot->warnings) {
    observability::record_config_warning(warning);
  }
  observability::record_config_published(
      outcome.snapshot->version,
      outcome.persisted_to.has_value() ? std::optional<std::string>(outcome.persisted_to->string())
                                       : std::nullopt);
  for (const auto &listener : listeners_) {
    listener(*outcome.snapshot);
  }
  return common::Result<UpdateOutcome>::success(std::move(outcome));
}

void ConfigStore::set_persist_fn(PersistFn persist) {
  std::lock_guard<std::mutex> update_lock(update_mutex_);
  persist_ = std::move(persist);
}

void ConfigStore::add_publish_listener(PublishListener listener) {
  std::lock_guard<std::mutex> update_lock(update_mutex_);
  listeners_.push_back(std::move(listener));
}

} // namespace shellguard::config
