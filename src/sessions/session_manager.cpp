#include "shellguard/sessions/session_manager.hpp"

#include "shellguard/common/fs.hpp"
#include "shellguard/observability/global.hpp"

#include <array>
#include <iomanip>
#include <openssl/rand.h>
#include <sstream>

namespace shellguard::sessions {

namespace {

common::Status require_approvable(const security::Category category) {
  if (!security::is_approvable(category)) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "category cannot be approved: " +
                                     security::category_to_string(category));
  }
  return common::Status::success();
}

} // namespace

SessionManager::SessionManager(const std::chrono::seconds ttl) : ttl_secs_(ttl.count()) {}

bool SessionManager::expired_locked(const Session &session, const Clock::time_point now) const {
  return now - session.last_activity > std::chrono::seconds(ttl_secs_.load());
}

void SessionManager::reset_locked(Session &session, const Clock::time_point now) const {
  session.created_at = now;
  session.last_activity = now;
  session.approved.clear();
  session.approved_once.clear();
  session.approved_commands.clear();
}

std::shared_ptr<SessionManager::Session> SessionManager::find(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

TouchOutcome SessionManager::with_session(const std::string &session_id,
                                          const Clock::time_point now,
                                          const std::function<void(Session &)> &fn) {
  while (true) {
    TouchOutcome outcome;
    std::shared_ptr<Session> session;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto &slot = sessions_[session_id];
      if (slot == nullptr) {
        slot = std::make_shared<Session>();
        slot->created_at = now;
        slot->last_activity = now;
        outcome.created = true;
      }
      session = slot;
    }

    std::lock_guard<std::mutex> session_lock(session->mutex);
    if (session->retired) {
      // Purged between lookup and lock; retry against the replacement.
      continue;
    }
    if (!outcome.created && expired_locked(*session, now)) {
      reset_locked(*session, now);
      outcome.expired = true;
    }
    session->last_activity = now;
    if (fn) {
      fn(*session);
    }
    if (outcome.expired) {
      observability::record_session_expired(session_id);
    }
    return outcome;
  }
}

TouchOutcome SessionManager::touch(const std::string &session_id) {
  return touch_at(session_id, Clock::now());
}

TouchOutcome SessionManager::touch_at(const std::string &session_id, const Clock::time_point now) {
  return with_session(session_id, now, nullptr);
}

common::Status SessionManager::approve(const std::string &session_id,
                                       const security::Category category) {
  return approve_at(session_id, category, Clock::now());
}

common::Status SessionManager::approve_at(const std::string &session_id,
                                          const security::Category category,
                                          const Clock::time_point now) {
  if (auto status = require_approvable(category); !status.ok()) {
    return status;
  }
  with_session(session_id, now, [category](Session &session) {
    session.approved.insert(category);
  });
  return common::Status::success();
}

common::Status SessionManager::grant_once(const std::string &session_id,
                                          const security::Category category) {
  return grant_once_at(session_id, category, Clock::now());
}

common::Status SessionManager::grant_once_at(const std::string &session_id,
                                             const security::Category category,
                                             const Clock::time_point now) {
  if (auto status = require_approvable(category); !status.ok()) {
    return status;
  }
  with_session(session_id, now, [category](Session &session) {
    session.approved_once.insert(category);
  });
  return common::Status::success();
}

bool SessionManager::claim_once(const std::string &session_id,
                                const std::vector<security::Category> &categories) {
  return claim_once_at(session_id, categories, Clock::now());
}

bool SessionManager::claim_once_at(const std::string &session_id,
                                   const std::vector<security::Category> &categories,
                                   const Clock::time_point now) {
  const auto session = find(session_id);
  if (session == nullptr) {
    return categories.empty();
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  if (session->retired || expired_locked(*session, now)) {
    return categories.empty();
  }
  std::vector<security::Category> spent;
  for (const auto category : categories) {
    if (session->approved.contains(category)) {
      continue;
    }
    if (!session->approved_once.contains(category)) {
      return false;
    }
    spent.push_back(category);
  }
  for (const auto category : spent) {
    session->approved_once.erase(category);
  }
  return true;
}

void SessionManager::restore_once(const std::string &session_id,
                                  const std::vector<security::Category> &categories) {
  const auto session = find(session_id);
  if (session == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  if (session->retired) {
    return;
  }
  for (const auto category : categories) {
    if (security::is_approvable(category)) {
      session->approved_once.insert(category);
    }
  }
}

void SessionManager::approve_command(const std::string &session_id, const std::string &command) {
  approve_command_at(session_id, command, Clock::now());
}

void SessionManager::approve_command_at(const std::string &session_id,
                                        const std::string &command, const Clock::time_point now) {
  const std::string normalized = common::trim(command);
  with_session(session_id, now, [&normalized](Session &session) {
    session.approved_commands.insert(normalized);
  });
}

bool SessionManager::is_approved(const std::string &session_id,
                                 const security::Category category) const {
  return is_approved_at(session_id, category, Clock::now());
}

bool SessionManager::is_approved_at(const std::string &session_id,
                                    const security::Category category,
                                    const Clock::time_point now) const {
  if (category == security::Category::Read) {
    return true;
  }
  if (!security::is_approvable(category)) {
    return false;
  }
  const auto session = find(session_id);
  if (session == nullptr) {
    return false;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  if (session->retired || expired_locked(*session, now)) {
    return false;
  }
  return session->approved.contains(category) || session->approved_once.contains(category);
}

Grant SessionManager::grant_at(const std::string &session_id, const security::Category category,
                               const Clock::time_point now) const {
  const auto session = find(session_id);
  if (session == nullptr) {
    return Grant::None;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  if (session->retired || expired_locked(*session, now)) {
    return Grant::None;
  }
  if (session->approved.contains(category)) {
    return Grant::Remembered;
  }
  return session->approved_once.contains(category) ? Grant::Once : Grant::None;
}

bool SessionManager::has_command_approval(const std::string &session_id,
                                          const std::string &command) const {
  return has_command_approval_at(session_id, command, Clock::now());
}

bool SessionManager::has_command_approval_at(const std::string &session_id,
                                             const std::string &command,
                                             const Clock::time_point now) const {
  const auto session = find(session_id);
  if (session == nullptr) {
    return false;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  if (session->retired || expired_locked(*session, now)) {
    return false;
  }
  return session->approved_commands.contains(common::trim(command));
}

std::size_t SessionManager::purge_expired() { return purge_expired_at(Clock::now()); }

std::size_t SessionManager::purge_expired_at(const Clock::time_point now) {
  std::vector<std::string> removed;
  std::size_t remaining = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      std::lock_guard<std::mutex> session_lock(it->second->mutex);
      if (expired_locked(*it->second, now)) {
        it->second->retired = true;
        removed.push_back(it->first);
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
    remaining = sessions_.size();
  }

  for (const auto &id : removed) {
    observability::record_session_expired(id);
  }
  observability::record_active_sessions(remaining);
  return removed.size();
}

void SessionManager::set_ttl(const std::chrono::seconds ttl) { ttl_secs_.store(ttl.count()); }

std::chrono::seconds SessionManager::ttl() const { return std::chrono::seconds(ttl_secs_.load()); }

std::size_t SessionManager::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::optional<SessionInfo> SessionManager::info(const std::string &session_id) const {
  const auto session = find(session_id);
  if (session == nullptr) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  SessionInfo out;
  out.id = session_id;
  out.created_at = session->created_at;
  out.last_activity = session->last_activity;
  out.approved.assign(session->approved.begin(), session->approved.end());
  out.approved_once.assign(session->approved_once.begin(), session->approved_once.end());
  out.approved_commands.assign(session->approved_commands.begin(),
                               session->approved_commands.end());
  return out;
}

common::Result<std::string>
SessionManager::resolve_session_id(const std::optional<std::string> &session_id,
                                   const bool require_session_id) {
  if (session_id.has_value() && !common::trim(*session_id).empty()) {
    return common::Result<std::string>::success(common::trim(*session_id));
  }
  if (!require_session_id) {
    return common::Result<std::string>::success(ANONYMOUS_SESSION_ID);
  }
  return generate_session_id();
}

common::Result<std::string> SessionManager::generate_session_id() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return common::Result<std::string>::failure(common::ErrorCode::Io,
                                                "failed to gather random bytes for session id");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return common::Result<std::string>::success(stream.str());
}

} // namespace shellguard::sessions
