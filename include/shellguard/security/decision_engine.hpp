#pragma once

#include "shellguard/common/result.hpp"
#include "shellguard/config/store.hpp"
#include "shellguard/security/command_parser.hpp"
#include "shellguard/security/verdict.hpp"
#include "shellguard/sessions/session_manager.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shellguard::security {

struct RawCommand {
  std::string command;
  std::optional<std::string> session_id;
};

struct Decision {
  Verdict verdict;
  std::string session_id;
  std::vector<CommandSegment> segments;
  bool background = false;
  std::uint64_t config_version = 0;
  /// Approved categories that rest on a one-shot grant; running the command
  /// must claim them first.
  std::vector<Category> one_shot;
};

/// Turns a raw command plus session context into a verdict. Every evaluation
/// reads a single configuration snapshot.
class DecisionEngine {
public:
  DecisionEngine(const config::ConfigStore &store, sessions::SessionManager &sessions);

  [[nodiscard]] common::Result<Decision> evaluate(const RawCommand &raw);
  [[nodiscard]] common::Result<Decision> evaluate_at(const RawCommand &raw,
                                                     sessions::Clock::time_point now);

  /// Categories in `segments` that still need the user's confirmation.
  [[nodiscard]] std::vector<Category>
  pending_categories(const config::ConfigSnapshot &snapshot, const std::string &session_id,
                     const std::vector<CommandSegment> &segments,
                     sessions::Clock::time_point now) const;

  /// Categories in `segments` approved only by a one-shot grant.
  [[nodiscard]] std::vector<Category>
  one_shot_categories(const config::ConfigSnapshot &snapshot, const std::string &session_id,
                      const std::vector<CommandSegment> &segments,
                      sessions::Clock::time_point now) const;

private:
  [[nodiscard]] static std::vector<Category>
  needed_categories(const config::ConfigSnapshot &snapshot,
                    const std::vector<CommandSegment> &segments);

  [[nodiscard]] Verdict decide(const config::ConfigSnapshot &snapshot, const RawCommand &raw,
                               const std::string &session_id, Decision &decision,
                               sessions::Clock::time_point now);

  const config::ConfigStore &store_;
  sessions::SessionManager &sessions_;
};

} // namespace shellguard::security
