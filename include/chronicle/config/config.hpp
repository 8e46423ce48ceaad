#pragma once

#include "chronicle/common/result.hpp"
#include "chronicle/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::config {

/// `$CHRONICLE_HOME`, else `~/.chronicle`. Created when missing.
[[nodiscard]] common::Result<std::filesystem::path> config_dir();
/// The override when set, else `$CHRONICLE_CONFIG`, else `<config_dir>/config.toml`.
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Reads the file at config_path(); a missing file yields defaults. Environment
/// overrides are applied last.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_from(const std::filesystem::path &path);
/// Parses TOML text without touching the environment or the filesystem.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

void apply_env_overrides(Config &config);

/// Hard problems are failures; the success value lists soft warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// history.base_dir expanded, or `<config_dir>/history` when unset.
[[nodiscard]] common::Result<std::filesystem::path> resolve_history_dir(const Config &config);

} // namespace chronicle::config
