#include <pinlock/lockfile.hpp>
#include <pinlock/log.hpp>
#include <fstream>
#include <sstream>

namespace pinlock {

namespace fs = std::filesystem;

LockFile::LockFile(fs::path path) : path_(std::move(path)) {
    // Anything worth locking installs at least one dependency.
    deps_.reserve(1);
}

Result<LockFile> LockFile::load(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return PinError{PinError::IO,
            "cannot open lock file: " + path.string(),
            "", path.string(), 0};
    }

    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return PinError{PinError::IO,
            "read error on lock file: " + path.string(),
            "", path.string(), 0};
    }

    auto deps = DependencyMap::from_json(buf.str());
    if (deps.is_err()) {
        return std::move(deps).at_file(path.string()).error();
    }

    LockFile lf(path);
    lf.deps_ = std::move(deps).value();
    log::debug("loaded %zu locked dependencies from %s",
               lf.deps_.size(), path.string().c_str());
    return Result<LockFile>::ok(std::move(lf));
}

Status LockFile::save() const {
    // Serialize before touching the file so an Encode error leaves the
    // previous lock file intact.
    auto text = deps_.to_json();
    if (text.is_err()) {
        return std::move(text).at_file(path_.string()).error();
    }

    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return PinError{PinError::IO,
            "cannot create lock file: " + path_.string(),
            "check that the project directory exists and is writable",
            path_.string(), 0};
    }

    out << text.value();
    out.flush();
    if (!out) {
        return PinError{PinError::IO,
            "write error on lock file: " + path_.string(),
            "", path_.string(), 0};
    }

    log::debug("wrote %zu locked dependencies to %s",
               deps_.size(), path_.string().c_str());
    return ok_status();
}

void LockFile::add(DependencyKey key, LockedDependency dep) {
    log::trace("lock %s -> %s", key.to_string().c_str(), dep.version.c_str());
    deps_.upsert(std::move(key), std::move(dep));
}

Status LockFile::add_checked(DependencyKey key, LockedDependency dep) {
    PINLOCK_TRY(dep.validate());
    add(std::move(key), std::move(dep));
    return ok_status();
}

bool LockFile::remove(const DependencyKey& key) {
    return deps_.erase(key);
}

const LockedDependency* LockFile::find(const DependencyKey& key) const {
    return deps_.find(key);
}

bool LockFile::contains(const DependencyKey& key) const {
    return deps_.contains(key);
}

size_t LockFile::size() const {
    return deps_.size();
}

} // namespace pinlock
