#include "shellguard/security/category.hpp"

#include "shellguard/common/fs.hpp"

namespace shellguard::security {

std::string category_to_string(const Category category) {
  switch (category) {
  case Category::Read:
    return "read";
  case Category::Write:
    return "write";
  case Category::System:
    return "system";
  case Category::Blocked:
    return "blocked";
  case Category::Unrecognized:
    return "unrecognized";
  }
  return "unrecognized";
}

common::Result<Category> category_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "read") {
    return common::Result<Category>::success(Category::Read);
  }
  if (normalized == "write") {
    return common::Result<Category>::success(Category::Write);
  }
  if (normalized == "system") {
    return common::Result<Category>::success(Category::System);
  }
  if (normalized == "blocked") {
    return common::Result<Category>::success(Category::Blocked);
  }
  if (normalized == "unrecognized") {
    return common::Result<Category>::success(Category::Unrecognized);
  }
  return common::Result<Category>::failure(common::ErrorCode::InvalidArgument,
                                           "unknown command category: " + value);
}

std::vector<std::string> categories_to_strings(const std::vector<Category> &values) {
  std::vector<std::string> out;
  out.reserve(values.size());
  for (const auto category : values) {
    out.push_back(category_to_string(category));
  }
  return out;
}

} // namespace shellguard::security
