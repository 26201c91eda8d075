#include <pinlock/version.hpp>
#include <cctype>

namespace pinlock {

static bool is_identifier_list(const std::string& s) {
    if (s.empty()) return false;
    bool segment_empty = true;
    for (char c : s) {
        if (c == '.') {
            if (segment_empty) return false;
            segment_empty = true;
            continue;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return false;
        }
        segment_empty = false;
    }
    return !segment_empty;
}

// Parse one numeric component. Leading zeros are not allowed ("01").
static Result<int> parse_component(const std::string& s, const char* what,
                                   const std::string& full) {
    if (s.empty()) {
        return PinError{PinError::Version,
            std::string("missing ") + what + " version in '" + full + "'",
            "expected a concrete version like 1.2.3"};
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return PinError{PinError::Version,
                std::string("invalid ") + what + " version in '" + full + "'",
                "version ranges cannot be locked; expected a concrete version like 1.2.3"};
        }
    }
    if (s.size() > 1 && s[0] == '0') {
        return PinError{PinError::Version,
            std::string("leading zero in ") + what + " version of '" + full + "'"};
    }
    if (s.size() > 9) {
        return PinError{PinError::Version,
            std::string(what) + " version out of range in '" + full + "'"};
    }
    return Result<int>::ok(std::stoi(s));
}

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return PinError{PinError::Version, "empty version string"};
    }

    Version v;
    std::string core = s;

    size_t plus = core.find('+');
    if (plus != std::string::npos) {
        v.build = core.substr(plus + 1);
        core = core.substr(0, plus);
        if (!is_identifier_list(v.build)) {
            return PinError{PinError::Version,
                "invalid build metadata in '" + s + "'"};
        }
    }

    size_t dash = core.find('-');
    if (dash != std::string::npos) {
        v.prerelease = core.substr(dash + 1);
        core = core.substr(0, dash);
        if (!is_identifier_list(v.prerelease)) {
            return PinError{PinError::Version,
                "invalid prerelease label in '" + s + "'"};
        }
    }

    size_t dot1 = core.find('.');
    size_t dot2 = dot1 == std::string::npos ? std::string::npos
                                            : core.find('.', dot1 + 1);
    if (dot1 == std::string::npos || dot2 == std::string::npos ||
        core.find('.', dot2 + 1) != std::string::npos) {
        return PinError{PinError::Version,
            "invalid version '" + s + "'",
            "expected format: major.minor.patch[-prerelease][+build]"};
    }

    auto major = parse_component(core.substr(0, dot1), "major", s);
    PINLOCK_TRY(major);
    auto minor = parse_component(core.substr(dot1 + 1, dot2 - dot1 - 1), "minor", s);
    PINLOCK_TRY(minor);
    auto patch = parse_component(core.substr(dot2 + 1), "patch", s);
    PINLOCK_TRY(patch);

    v.major = major.value();
    v.minor = minor.value();
    v.patch = patch.value();
    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." + std::to_string(minor) +
                    "." + std::to_string(patch);
    if (!prerelease.empty()) s += "-" + prerelease;
    if (!build.empty()) s += "+" + build;
    return s;
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor && patch == o.patch &&
           prerelease == o.prerelease;
}

bool Version::operator!=(const Version& o) const {
    return !(*this == o);
}

} // namespace pinlock
