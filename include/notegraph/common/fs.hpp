#pragma once

#include "notegraph/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace notegraph::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// True when `candidate`, after lexical normalization, lies inside `parent`.
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                              const std::filesystem::path &parent);

[[nodiscard]] Result<std::vector<std::uint8_t>> read_binary(const std::filesystem::path &path);
[[nodiscard]] Status write_binary(const std::filesystem::path &path,
                                  const std::vector<std::uint8_t> &bytes);

} // namespace notegraph::common
