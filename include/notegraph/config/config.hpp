#pragma once

#include "notegraph/common/result.hpp"
#include "notegraph/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace notegraph::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Expanded `data_dir` (tilde and $VARS resolved).
[[nodiscard]] std::filesystem::path data_dir(const Config &config);

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Human-readable problems; empty when the config is usable.
[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace notegraph::config
