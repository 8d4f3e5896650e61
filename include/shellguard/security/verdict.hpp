#pragma once

#include "shellguard/common/result.hpp"
#include "shellguard/security/category.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace shellguard::security {

struct Approved {};

struct RequiresApproval {
  std::vector<Category> categories;
};

struct Rejected {
  common::ErrorCode kind = common::ErrorCode::CommandNotPermitted;
  std::string reason;
  std::optional<std::size_t> segment_index;
};

using Verdict = std::variant<Approved, RequiresApproval, Rejected>;

[[nodiscard]] std::string verdict_name(const Verdict &verdict);

[[nodiscard]] inline bool is_approved(const Verdict &verdict) {
  return std::holds_alternative<Approved>(verdict);
}

} // namespace shellguard::security
