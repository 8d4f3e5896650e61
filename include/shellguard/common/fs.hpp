#pragma once

#include "shellguard/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace shellguard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_list(const std::string &value, char delimiter = ',');
[[nodiscard]] std::string join(const std::vector<std::string> &values, const std::string &glue);
[[nodiscard]] Result<bool> parse_bool(const std::string &value);
[[nodiscard]] Result<std::uint64_t> parse_u64(const std::string &value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace shellguard::common
