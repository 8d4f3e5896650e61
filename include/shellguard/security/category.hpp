#pragma once

#include "shellguard/common/result.hpp"

#include <string>
#include <vector>

namespace shellguard::security {

enum class Category { Read, Write, System, Blocked, Unrecognized };

[[nodiscard]] std::string category_to_string(Category category);
[[nodiscard]] common::Result<Category> category_from_string(const std::string &value);
[[nodiscard]] std::vector<std::string> categories_to_strings(const std::vector<Category> &values);

/// Only Write and System can be granted by a user.
[[nodiscard]] constexpr bool is_approvable(const Category category) {
  return category == Category::Write || category == Category::System;
}

} // namespace shellguard::security
