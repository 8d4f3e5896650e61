#include "shellguard/security/decision_engine.hpp"

#include "shellguard/observability/global.hpp"

#include <algorithm>
#include <string>

namespace shellguard::security {

namespace {

Rejected reject(const common::ErrorCode kind, std::string reason,
                const std::optional<std::size_t> segment_index = std::nullopt) {
  return Rejected{.kind = kind, .reason = std::move(reason), .segment_index = segment_index};
}

std::string separator_display(const char separator) {
  if (separator == '\n') {
    return "\\n";
  }
  return std::string(1, separator);
}

std::string rejection_reason(const Verdict &verdict) {
  if (const auto *rejected = std::get_if<Rejected>(&verdict); rejected != nullptr) {
    return rejected->reason;
  }
  if (const auto *pending = std::get_if<RequiresApproval>(&verdict); pending != nullptr) {
    std::string reason = "needs approval:";
    for (const auto category : pending->categories) {
      reason += " " + category_to_string(category);
    }
    return reason;
  }
  return "";
}

} // namespace

DecisionEngine::DecisionEngine(const config::ConfigStore &store,
                               sessions::SessionManager &sessions)
    : store_(store), sessions_(sessions) {}

common::Result<Decision> DecisionEngine::evaluate(const RawCommand &raw) {
  return evaluate_at(raw, sessions::Clock::now());
}

common::Result<Decision> DecisionEngine::evaluate_at(const RawCommand &raw,
                                                     const sessions::Clock::time_point now) {
  const auto started = std::chrono::steady_clock::now();
  const auto snapshot = store_.snapshot();

  auto session_id = sessions::SessionManager::resolve_session_id(
      raw.session_id, snapshot->config.security.require_session_id);
  if (!session_id.ok()) {
    return common::Result<Decision>::failure(session_id.status());
  }

  Decision decision;
  decision.session_id = session_id.value();
  decision.config_version = snapshot->version;
  decision.verdict = decide(*snapshot, raw, decision.session_id, decision, now);

  observability::record_decision(raw.command, decision.session_id, verdict_name(decision.verdict),
                                 rejection_reason(decision.verdict));
  observability::record_decision_latency(std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - started));
  return common::Result<Decision>::success(std::move(decision));
}

Verdict DecisionEngine::decide(const config::ConfigSnapshot &snapshot, const RawCommand &raw,
                               const std::string &session_id, Decision &decision,
                               const sessions::Clock::time_point now) {
  const auto &sec = snapshot.config.security;

  // Bounds tokenizer and regex cost; the matcher recurses with input length.
  if (raw.command.size() > sec.max_command_length) {
    return reject(common::ErrorCode::MalformedInput,
                  "malformed input: command is " + std::to_string(raw.command.size()) +
                      " characters, limit is " + std::to_string(sec.max_command_length));
  }

  auto parsed = parse_command_line(raw.command, SeparatorPolicy::from_config(sec));
  if (!parsed.ok()) {
    return reject(common::ErrorCode::MalformedInput, "malformed input: " + parsed.error());
  }
  decision.segments = std::move(parsed.value());
  snapshot.classifier.classify_segments(decision.segments);
  decision.background = std::any_of(decision.segments.begin(), decision.segments.end(),
                                    [](const CommandSegment &segment) { return segment.background; });

  for (std::size_t index = 0; index < decision.segments.size(); ++index) {
    const auto &disabled = decision.segments[index].disabled_separators;
    if (!disabled.empty()) {
      return reject(common::ErrorCode::DangerousPattern,
                    "command separator not permitted: " + separator_display(disabled.front()),
                    index);
    }
  }

  if (const auto match = snapshot.matcher.find(raw.command, decision.segments); match.has_value()) {
    return reject(common::ErrorCode::DangerousPattern, "dangerous pattern: " + match->pattern,
                  match->segment_index);
  }

  for (std::size_t index = 0; index < decision.segments.size(); ++index) {
    const auto &segment = decision.segments[index];
    const bool denied =
        segment.category == Category::Blocked ||
        (segment.category == Category::Unrecognized && !sec.allow_unrecognized_commands);
    if (denied) {
      return reject(common::ErrorCode::CommandNotPermitted,
                    "command not permitted: " + segment.base_command, index);
    }
  }

  sessions_.touch_at(session_id, now);
  if (!sec.allow_user_confirmation) {
    return Approved{};
  }
  if (sessions_.has_command_approval_at(session_id, raw.command, now)) {
    return Approved{};
  }

  auto pending = pending_categories(snapshot, session_id, decision.segments, now);
  if (pending.empty()) {
    decision.one_shot = one_shot_categories(snapshot, session_id, decision.segments, now);
    return Approved{};
  }
  return RequiresApproval{.categories = std::move(pending)};
}

std::vector<Category>
DecisionEngine::needed_categories(const config::ConfigSnapshot &snapshot,
                                  const std::vector<CommandSegment> &segments) {
  std::vector<Category> needed;
  for (const auto &segment : segments) {
    Category category = segment.category;
    if (category == Category::Unrecognized &&
        snapshot.config.security.allow_unrecognized_commands) {
      category = Category::System;
    }
    if (is_approvable(category) &&
        std::find(needed.begin(), needed.end(), category) == needed.end()) {
      needed.push_back(category);
    }
  }
  std::sort(needed.begin(), needed.end());
  return needed;
}

std::vector<Category> DecisionEngine::pending_categories(const config::ConfigSnapshot &snapshot,
                                                         const std::string &session_id,
                                                         const std::vector<CommandSegment> &segments,
                                                         const sessions::Clock::time_point now) const {
  std::vector<Category> pending;
  for (const auto category : needed_categories(snapshot, segments)) {
    if (!sessions_.is_approved_at(session_id, category, now)) {
      pending.push_back(category);
    }
  }
  return pending;
}

std::vector<Category>
DecisionEngine::one_shot_categories(const config::ConfigSnapshot &snapshot,
                                    const std::string &session_id,
                                    const std::vector<CommandSegment> &segments,
                                    const sessions::Clock::time_point now) const {
  std::vector<Category> once;
  for (const auto category : needed_categories(snapshot, segments)) {
    if (sessions_.grant_at(session_id, category, now) == sessions::Grant::Once) {
      once.push_back(category);
    }
  }
  return once;
}

} // namespace shellguard::security
