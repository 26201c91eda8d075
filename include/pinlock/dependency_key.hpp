#pragma once

#include <pinlock/result.hpp>
#include <cstddef>
#include <functional>
#include <string>

namespace pinlock {

// A dependency reference as written by the user: name plus the version
// requirement it was requested with, e.g. "react@^18.2.0" or
// "@babel/core@~7.22.0".
//
// Identity is the canonical string "name@version_spec". Equality, hashing,
// ordering and the on-disk key all go through to_string(), so two keys are
// the same iff their canonical strings are.
class DependencyKey {
public:
    DependencyKey() = default;
    DependencyKey(std::string name, std::string version_spec);

    // Validating constructor. The name must be non-empty and may contain
    // '@' only as a leading scope marker.
    static Result<DependencyKey> make(const std::string& name,
                                      const std::string& version_spec);

    // Decode "name@version_spec". The boundary is the first '@' that is not
    // the leading character, so scoped names decode unambiguously.
    static Result<DependencyKey> parse(const std::string& canonical);

    const std::string& name() const { return name_; }
    const std::string& version_spec() const { return version_spec_; }

    std::string to_string() const;

    bool operator==(const DependencyKey& o) const;
    bool operator!=(const DependencyKey& o) const;
    bool operator<(const DependencyKey& o) const;

private:
    std::string name_;
    std::string version_spec_;
};

} // namespace pinlock

namespace std {

template<>
struct hash<pinlock::DependencyKey> {
    size_t operator()(const pinlock::DependencyKey& k) const {
        return hash<std::string>{}(k.to_string());
    }
};

} // namespace std
