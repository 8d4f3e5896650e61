#pragma once

#include "shellguard/common/result.hpp"
#include "shellguard/security/category.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace shellguard::sessions {

using Clock = std::chrono::steady_clock;

/// Shared by callers that omit a session id when ids are optional.
inline constexpr const char *ANONYMOUS_SESSION_ID = "anonymous";

/// Where a category's approval in a session comes from.
enum class Grant { None, Remembered, Once };

struct TouchOutcome {
  bool created = false;
  bool expired = false;
};

struct SessionInfo {
  std::string id;
  Clock::time_point created_at;
  Clock::time_point last_activity;
  std::vector<security::Category> approved;
  std::vector<security::Category> approved_once;
  std::vector<std::string> approved_commands;
};

/// Per-session approval state. A session idle for longer than the ttl is
/// expired: queries see nothing approved and the next use starts it afresh.
class SessionManager {
public:
  explicit SessionManager(std::chrono::seconds ttl);

  TouchOutcome touch(const std::string &session_id);
  TouchOutcome touch_at(const std::string &session_id, Clock::time_point now);

  /// Write and System only. Idempotent.
  [[nodiscard]] common::Status approve(const std::string &session_id,
                                       security::Category category);
  [[nodiscard]] common::Status approve_at(const std::string &session_id,
                                          security::Category category, Clock::time_point now);

  /// Approves `category` for the next executed command only.
  [[nodiscard]] common::Status grant_once(const std::string &session_id,
                                          security::Category category);
  [[nodiscard]] common::Status grant_once_at(const std::string &session_id,
                                             security::Category category, Clock::time_point now);
  /// Spends the one-shot grants behind `categories` in one step. Fails and
  /// spends nothing when any of them is no longer approved.
  [[nodiscard]] bool claim_once(const std::string &session_id,
                                const std::vector<security::Category> &categories);
  [[nodiscard]] bool claim_once_at(const std::string &session_id,
                                   const std::vector<security::Category> &categories,
                                   Clock::time_point now);
  /// Gives back grants taken by claim_once for a command that never ran.
  void restore_once(const std::string &session_id,
                    const std::vector<security::Category> &categories);

  void approve_command(const std::string &session_id, const std::string &command);
  void approve_command_at(const std::string &session_id, const std::string &command,
                          Clock::time_point now);

  [[nodiscard]] bool is_approved(const std::string &session_id,
                                 security::Category category) const;
  [[nodiscard]] bool is_approved_at(const std::string &session_id, security::Category category,
                                    Clock::time_point now) const;

  [[nodiscard]] Grant grant_at(const std::string &session_id, security::Category category,
                               Clock::time_point now) const;

  [[nodiscard]] bool has_command_approval(const std::string &session_id,
                                          const std::string &command) const;
  [[nodiscard]] bool has_command_approval_at(const std::string &session_id,
                                             const std::string &command,
                                             Clock::time_point now) const;

  /// Removes sessions idle past the ttl; returns how many were removed.
  std::size_t purge_expired();
  std::size_t purge_expired_at(Clock::time_point now);

  void set_ttl(std::chrono::seconds ttl);
  [[nodiscard]] std::chrono::seconds ttl() const;

  [[nodiscard]] std::size_t active_count() const;
  [[nodiscard]] std::optional<SessionInfo> info(const std::string &session_id) const;

  /// `"anonymous"` when ids are optional, a fresh UUIDv4 when they are required.
  [[nodiscard]] static common::Result<std::string>
  resolve_session_id(const std::optional<std::string> &session_id, bool require_session_id);
  [[nodiscard]] static common::Result<std::string> generate_session_id();

private:
  struct Session {
    std::mutex mutex;
    Clock::time_point created_at;
    Clock::time_point last_activity;
    std::set<security::Category> approved;
    std::set<security::Category> approved_once;
    std::set<std::string> approved_commands;
    bool retired = false;
  };

  [[nodiscard]] bool expired_locked(const Session &session, Clock::time_point now) const;
  void reset_locked(Session &session, Clock::time_point now) const;
  [[nodiscard]] std::shared_ptr<Session> find(const std::string &session_id) const;
  /// Runs `fn` with the live, touched session locked.
  TouchOutcome with_session(const std::string &session_id, Clock::time_point now,
                            const std::function<void(Session &)> &fn);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
  std::atomic<std::int64_t> ttl_secs_;
};

} // namespace shellguard::sessions
