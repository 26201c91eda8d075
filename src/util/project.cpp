#include <pinlock/project.hpp>
#include <pinlock/log.hpp>

namespace pinlock {

namespace fs = std::filesystem;

fs::path lockfile_path(const fs::path& project_root, const Config& config) {
    return project_root / config.lockfile_name;
}

Result<fs::path> find_lockfile(const fs::path& start_dir, const Config& config) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return PinError{PinError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        fs::path candidate = dir / config.lockfile_name;
        if (fs::is_regular_file(candidate, ec)) {
            return Result<fs::path>::ok(candidate);
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            return PinError{PinError::NotFound,
                "no " + config.lockfile_name + " found in " +
                start_dir.string() + " or any parent directory"};
        }
        dir = parent;
    }
}

static Result<std::optional<Config>> load_optional(const fs::path& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path.string());
    PINLOCK_TRY(cfg);
    log::debug("loaded config %s", path.string().c_str());
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

Result<Config> load_config(const fs::path& project_root) {
    auto global = load_optional(global_config_path());
    PINLOCK_TRY(global);
    auto project = load_optional(project_root / kProjectConfigName);
    PINLOCK_TRY(project);
    return Result<Config>::ok(Config::effective(global.value(), project.value()));
}

} // namespace pinlock
