#include "shellguard/observability/log_observer.hpp"

#include "shellguard/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace shellguard::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<LogLevel> log_level_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return common::Result<LogLevel>::success(LogLevel::Debug);
  }
  if (normalized == "info") {
    return common::Result<LogLevel>::success(LogLevel::Info);
  }
  if (normalized == "warn" || normalized == "warning") {
    return common::Result<LogLevel>::success(LogLevel::Warn);
  }
  if (normalized == "error") {
    return common::Result<LogLevel>::success(LogLevel::Error);
  }
  return common::Result<LogLevel>::failure(common::ErrorCode::ConfigurationError,
                                           "unknown log level: " + value);
}

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DecisionEvent>) {
          std::string line = "decision verdict=" + evt.verdict + " session=" + evt.session_id +
                             " command=" + evt.command;
          if (!evt.reason.empty()) {
            line += " reason=" + evt.reason;
          }
          log_line(evt.verdict == "rejected" ? LogLevel::Warn : LogLevel::Info, line);
        } else if constexpr (std::is_same_v<T, ApprovalGrantedEvent>) {
          log_line(LogLevel::Info, "approval.granted session=" + evt.session_id +
                                       " scope=" + evt.scope +
                                       " remember=" + bool_text(evt.remember));
        } else if constexpr (std::is_same_v<T, SessionExpiredEvent>) {
          log_line(LogLevel::Debug, "session.expired id=" + evt.session_id);
        } else if constexpr (std::is_same_v<T, ConfigPublishedEvent>) {
          std::string line = "config.published version=" + std::to_string(evt.version);
          if (evt.persisted_to.has_value()) {
            line += " persisted_to=" + *evt.persisted_to;
          }
          log_line(LogLevel::Info, line);
        } else if constexpr (std::is_same_v<T, ConfigWarningEvent>) {
          log_line(LogLevel::Warn, "config: " + evt.message);
        } else if constexpr (std::is_same_v<T, CommandExecutedEvent>) {
          log_line(LogLevel::Info, "command.executed exit_code=" + std::to_string(evt.exit_code) +
                                       " duration_ms=" + std::to_string(evt.duration.count()) +
                                       " truncated=" + bool_text(evt.truncated) +
                                       " timed_out=" + bool_text(evt.timed_out) +
                                       " command=" + evt.command);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line(LogLevel::Debug, "metric.active_sessions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, DecisionLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.decision_latency_us=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace shellguard::observability
