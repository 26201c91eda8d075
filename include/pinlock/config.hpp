#pragma once

#include <pinlock/integrity.hpp>
#include <pinlock/log.hpp>
#include <pinlock/result.hpp>
#include <optional>
#include <string>

namespace pinlock {

// Layered configuration: global (~/.pinlock/config.toml) then project
// (<root>/.pinlock.toml). Later layers override only the keys they set.
//
//   [lockfile]
//   name = "pin.lock"
//   [integrity]
//   algorithm = "sha1"
//   [log]
//   level = "info"
//   color = true
struct Config {
    std::string lockfile_name = "pin.lock";
    Algorithm algorithm = Algorithm::Sha1;
    log::Level log_level = log::Info;
    bool log_color = false;

    // Track which fields were explicitly set (for merge)
    bool lockfile_name_set = false;
    bool algorithm_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Push log settings into the logger
    void apply_logging() const;
};

// ~/.pinlock/config.toml, or empty if no home directory is known
std::string global_config_path();

} // namespace pinlock
