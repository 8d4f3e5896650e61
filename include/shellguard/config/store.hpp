#pragma once

#include "shellguard/common/result.hpp"
#include "shellguard/config/config.hpp"
#include "shellguard/config/schema.hpp"
#include "shellguard/security/classifier.hpp"
#include "shellguard/security/pattern_matcher.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shellguard::config {

/// Immutable view of one configuration version plus the structures derived
/// from it.
struct ConfigSnapshot {
  std::uint64_t version = 0;
  Config config;
  security::CommandClassifier classifier;
  security::PatternMatcher matcher;
  std::vector<std::string> warnings;
};

[[nodiscard]] common::Result<std::shared_ptr<const ConfigSnapshot>>
build_snapshot(Config config, std::uint64_t version);

struct UpdateOutcome {
  std::shared_ptr<const ConfigSnapshot> snapshot;
  std::optional<std::filesystem::path> persisted_to;
};

class ConfigStore {
public:
  using PersistFn = std::function<common::Status(const Config &)>;
  using PublishListener = std::function<void(const ConfigSnapshot &)>;

  /// Persists through `save_config` unless another writer is supplied.
  [[nodiscard]] static common::Result<std::unique_ptr<ConfigStore>> create(Config initial);
  [[nodiscard]] static common::Result<std::unique_ptr<ConfigStore>> load();

  [[nodiscard]] std::shared_ptr<const ConfigSnapshot> snapshot() const;

  /// Merges `overlay` into the live configuration. A failed merge, validation
  /// or persist leaves the live snapshot untouched.
  [[nodiscard]] common::Result<UpdateOutcome> update(const ConfigOverlay &overlay, bool persist);

  void set_persist_fn(PersistFn persist);
  void add_publish_listener(PublishListener listener);

private:
  explicit ConfigStore(std::shared_ptr<const ConfigSnapshot> initial);

  mutable std::mutex snapshot_mutex_;
  std::mutex update_mutex_;
  std::shared_ptr<const ConfigSnapshot> current_;
  PersistFn persist_;
  std::vector<PublishListener> listeners_;
};

} // namespace shellguard::config
