#include "shellguard/observability/global.hpp"

#include <mutex>

namespace shellguard::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_decision(const std::string &command, const std::string &session_id,
                     const std::string &verdict, const std::string &reason) {
  record_event(DecisionEvent{
      .command = command, .session_id = session_id, .verdict = verdict, .reason = reason});
}

void record_approval(const std::string &session_id, const std::string &scope,
                     const bool remember) {
  record_event(ApprovalGrantedEvent{.session_id = session_id, .scope = scope, .remember = remember});
}

void record_session_expired(const std::string &session_id) {
  record_event(SessionExpiredEvent{.session_id = session_id});
}

void record_config_published(const std::uint64_t version,
                             std::optional<std::string> persisted_to) {
  record_event(ConfigPublishedEvent{.version = version, .persisted_to = std::move(persisted_to)});
}

void record_config_warning(const std::string &message) {
  record_event(ConfigWarningEvent{.message = message});
}

void record_command_executed(const std::string &command, const int exit_code,
                             const std::chrono::milliseconds duration, const bool truncated,
                             const bool timed_out) {
  record_event(CommandExecutedEvent{.command = command,
                                    .exit_code = exit_code,
                                    .duration = duration,
                                    .truncated = truncated,
                                    .timed_out = timed_out});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_active_sessions(const std::uint64_t count) {
  record_metric(ActiveSessionsMetric{.count = count});
}

void record_decision_latency(const std::chrono::microseconds latency) {
  record_metric(DecisionLatencyMetric{.latency = latency});
}

} // namespace shellguard::observability
