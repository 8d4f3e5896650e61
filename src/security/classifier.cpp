#include "shellguard/security/classifier.hpp"

#include <algorithm>

namespace shellguard::security {

CommandClassifier::CommandClassifier(const config::CommandsConfig &commands) {
  // Later assignments overwrite earlier ones.
  assign(commands.read_commands, Category::Read);
  assign(commands.write_commands, Category::Write);
  assign(commands.system_commands, Category::System);
  assign(commands.blocked_commands, Category::Blocked);
}

void CommandClassifier::assign(const std::vector<std::string> &names, const Category category) {
  for (const auto &name : names) {
    categories_[name] = category;
  }
}

Category CommandClassifier::classify(const std::string &base_command) const {
  if (base_command.empty() || base_command.find('/') != std::string::npos) {
    return Category::Unrecognized;
  }
  const auto it = categories_.find(base_command);
  return it == categories_.end() ? Category::Unrecognized : it->second;
}

void CommandClassifier::classify_segments(std::vector<CommandSegment> &segments) const {
  for (auto &segment : segments) {
    segment.category = classify(segment.base_command);
  }
}

std::vector<std::string> CommandClassifier::names(const Category category) const {
  std::vector<std::string> out;
  for (const auto &[name, assigned] : categories_) {
    if (assigned == category) {
      out.push_back(name);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace shellguard::security
