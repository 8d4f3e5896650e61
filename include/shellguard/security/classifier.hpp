#pragma once

#include "shellguard/config/schema.hpp"
#include "shellguard/security/category.hpp"
#include "shellguard/security/command_parser.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace shellguard::security {

/// Name -> Category map built once per configuration snapshot.
/// Precedence when a name is listed more than once: Blocked > System > Write > Read.
class CommandClassifier {
public:
  CommandClassifier() = default;
  explicit CommandClassifier(const config::CommandsConfig &commands);

  [[nodiscard]] Category classify(const std::string &base_command) const;
  void classify_segments(std::vector<CommandSegment> &segments) const;

  /// Sorted names that resolve to `category`.
  [[nodiscard]] std::vector<std::string> names(Category category) const;

private:
  void assign(const std::vector<std::string> &names, Category category);

  std::unordered_map<std::string, Category> categories_;
};

} // namespace shellguard::security
