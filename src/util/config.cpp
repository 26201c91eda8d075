#include <pinlock/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace pinlock {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PinError{PinError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [lockfile] section
    if (auto lock = doc["lockfile"].as_table()) {
        if (auto v = (*lock)["name"].value<std::string>()) {
            if (v->empty() || *v == "." || *v == ".." ||
                v->find('/') != std::string::npos ||
                v->find('\\') != std::string::npos) {
                return PinError{PinError::Config,
                    "invalid lockfile.name '" + *v + "'",
                    "use a bare file name such as \"pin.lock\""};
            }
            cfg.lockfile_name = *v;
            cfg.lockfile_name_set = true;
        }
    }

    // [integrity] section
    if (auto integ = doc["integrity"].as_table()) {
        if (auto v = (*integ)["algorithm"].value<std::string>()) {
            auto alg = parse_algorithm(*v);
            if (alg.is_err() || (alg.value() != Algorithm::Sha1 &&
                                 alg.value() != Algorithm::Sha512)) {
                return PinError{PinError::Config,
                    "unsupported integrity.algorithm '" + *v + "'",
                    "expected \"sha1\" or \"sha512\""};
            }
            cfg.algorithm = alg.value();
            cfg.algorithm_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            PINLOCK_TRY(lvl);
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PinError{PinError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str()).at_file(path);
}

void Config::merge(const Config& other) {
    if (other.lockfile_name_set) {
        lockfile_name = other.lockfile_name;
        lockfile_name_set = true;
    }
    if (other.algorithm_set) {
        algorithm = other.algorithm;
        algorithm_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

void Config::apply_logging() const {
    log::set_level(log_level);
    if (log_color_set) {
        log::set_color_enabled(log_color);
    }
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.pinlock/config.toml";
}

} // namespace pinlock
