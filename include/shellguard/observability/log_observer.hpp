#pragma once

#include "shellguard/common/result.hpp"
#include "shellguard/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace shellguard::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

[[nodiscard]] common::Result<LogLevel> log_level_from_string(const std::string &value);
[[nodiscard]] std::string_view log_level_name(LogLevel level);

/// Writes `[LEVEL] message` lines, dropping anything below `min_level`.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(LogLevel min_level, std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream *out_;
  std::mutex mutex_;
};

} // namespace shellguard::observability
