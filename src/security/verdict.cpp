#include "shellguard/security/verdict.hpp"

#include <type_traits>

namespace shellguard::security {

std::string verdict_name(const Verdict &verdict) {
  return std::visit(
      [](const auto &value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Approved>) {
          return "approved";
        } else if constexpr (std::is_same_v<T, RequiresApproval>) {
          return "requires_approval";
        } else {
          return "rejected";
        }
      },
      verdict);
}

} // namespace shellguard::security
