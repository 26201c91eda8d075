#pragma once

#include <pinlock/dependency_map.hpp>
#include <pinlock/result.hpp>
#include <filesystem>
#include <string>

namespace pinlock {

// Pins every dependency of a project to the exact version, archive URL and
// integrity it was installed with.
//
//   auto lf = LockFile::load(path);       // or LockFile(path) for a new one
//   lf.add(DependencyKey("react", "^18.2.0"), record);
//   PINLOCK_TRY(lf.save());
//
// Only save() touches the disk. It truncates and rewrites the file in
// place: a crash mid-write can leave a partial file behind. Concurrent
// savers on the same path are last-writer-wins.
class LockFile {
public:
    // Empty lock file bound to `path`; nothing is read or written.
    explicit LockFile(std::filesystem::path path);

    // IO error if the file can't be opened (including when it doesn't
    // exist), Decode error if its content isn't a valid lock file.
    static Result<LockFile> load(const std::filesystem::path& path);

    // Write the sorted representation to path(). IO error on filesystem
    // failure, Encode error if serialization fails.
    Status save() const;

    // Insert or replace. The previous record for `key`, if any, is dropped.
    void add(DependencyKey key, LockedDependency dep);

    // add() after LockedDependency::validate() succeeds
    Status add_checked(DependencyKey key, LockedDependency dep);

    bool remove(const DependencyKey& key);

    // Returns nullptr if not locked
    const LockedDependency* find(const DependencyKey& key) const;
    bool contains(const DependencyKey& key) const;
    size_t size() const;

    const DependencyMap& dependencies() const { return deps_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    DependencyMap deps_;
};

} // namespace pinlock
