#pragma once

#include <pinlock/result.hpp>
#include <string>

namespace pinlock {

// Concrete version: major.minor.patch[-prerelease][+build]
// Ranges ("^1.2.0", ">=1", "1.x") are rejected; resolving them is the
// resolver's job, the lock file only stores what it produced.
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;  // e.g. "beta.1", empty for release
    std::string build;       // e.g. "sha.5114f85", ignored for equality

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
};

} // namespace pinlock
