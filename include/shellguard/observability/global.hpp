#pragma once

#include "shellguard/observability/observer.hpp"

#include <cstdint>
#include <memory>

namespace shellguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_decision(const std::string &command, const std::string &session_id,
                     const std::string &verdict, const std::string &reason);
void record_approval(const std::string &session_id, const std::string &scope, bool remember);
void record_session_expired(const std::string &session_id);
void record_config_published(std::uint64_t version,
                             std::optional<std::string> persisted_to = std::nullopt);
void record_config_warning(const std::string &message);
void record_command_executed(const std::string &command, int exit_code,
                             std::chrono::milliseconds duration, bool truncated, bool timed_out);
void record_error(const std::string &component, const std::string &message);

void record_active_sessions(std::uint64_t count);
void record_decision_latency(std::chrono::microseconds latency);

} // namespace shellguard::observability
