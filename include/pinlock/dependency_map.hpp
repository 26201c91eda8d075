#pragma once

#include <pinlock/dependency_key.hpp>
#include <pinlock/result.hpp>
#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>

namespace pinlock {

// What the resolver and fetcher produced for one dependency.
struct LockedDependency {
    std::string name;
    std::string version;    // concrete, never a range
    std::string tarball;    // where the archive was downloaded from
    std::string integrity;  // "sha1-..." or "sha512-..."; stored under "sha1"

    // Version errors for non-concrete versions, InvalidArg for empty
    // name/tarball, HashParse for a malformed integrity string.
    Status validate() const;

    bool operator==(const LockedDependency& o) const;
    bool operator!=(const LockedDependency& o) const;
};

// Key -> record store. Lookups go through a hash map; serialization always
// walks the entries in canonical key order, so the output only depends on
// the logical content and never on insertion history.
class DependencyMap {
public:
    using Storage = std::unordered_map<DependencyKey, LockedDependency>;
    using Sorted = std::map<DependencyKey, LockedDependency>;

    DependencyMap() = default;

    void reserve(size_t n) { entries_.reserve(n); }

    // Insert, or replace the existing record for `key`. Returns true if a
    // record was replaced.
    bool upsert(DependencyKey key, LockedDependency dep);
    bool erase(const DependencyKey& key);

    const LockedDependency* find(const DependencyKey& key) const;
    bool contains(const DependencyKey& key) const { return find(key) != nullptr; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const Storage& entries() const { return entries_; }

    // Snapshot of the entries in canonical key order
    Sorted sorted() const;

    // JSON object keyed by "name@version_spec", two-space indent, trailing
    // newline. Encode error if the content can't be represented (e.g. a
    // field that is not valid UTF-8).
    Result<std::string> to_json() const;

    // Entries may appear in any order. Decode error on malformed JSON,
    // a bad key, or a record missing one of its string fields.
    static Result<DependencyMap> from_json(const std::string& text);

    bool operator==(const DependencyMap& o) const { return entries_ == o.entries_; }
    bool operator!=(const DependencyMap& o) const { return !(*this == o); }

private:
    Storage entries_;
};

} // namespace pinlock
