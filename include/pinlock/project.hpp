#pragma once

#include <pinlock/config.hpp>
#include <pinlock/result.hpp>
#include <filesystem>

namespace pinlock {

// Project-level config file name, looked up in the project root
inline constexpr const char* kProjectConfigName = ".pinlock.toml";

// <project_root>/<config.lockfile_name>
std::filesystem::path lockfile_path(const std::filesystem::path& project_root,
                                    const Config& config);

// Walk up from start_dir to the nearest directory holding a lock file.
// NotFound if none exists up to the filesystem root.
Result<std::filesystem::path> find_lockfile(const std::filesystem::path& start_dir,
                                            const Config& config);

// Global config merged with <project_root>/.pinlock.toml; missing files are
// skipped, malformed ones are errors.
Result<Config> load_config(const std::filesystem::path& project_root);

} // namespace pinlock
