#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace shellguard::observability {

struct DecisionEvent {
  std::string command;
  std::string session_id;
  std::string verdict;
  std::string reason;
};

struct ApprovalGrantedEvent {
  std::string session_id;
  /// Category name, or the exact command for command approvals.
  std::string scope;
  bool remember = true;
};

struct SessionExpiredEvent {
  std::string session_id;
};

struct ConfigPublishedEvent {
  std::uint64_t version = 0;
  std::optional<std::string> persisted_to;
};

struct ConfigWarningEvent {
  std::string message;
};

struct CommandExecutedEvent {
  std::string command;
  int exit_code = 0;
  std::chrono::milliseconds duration{0};
  bool truncated = false;
  bool timed_out = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<DecisionEvent, ApprovalGrantedEvent, SessionExpiredEvent, ConfigPublishedEvent,
                 ConfigWarningEvent, CommandExecutedEvent, ErrorEvent>;

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

struct DecisionLatencyMetric {
  std::chrono::microseconds latency{0};
};

using ObserverMetric = std::variant<ActiveSessionsMetric, DecisionLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace shellguard::observability
