#include <pinlock/dependency_key.hpp>

namespace pinlock {

static constexpr char kDelimiter = '@';

DependencyKey::DependencyKey(std::string name, std::string version_spec)
    : name_(std::move(name)), version_spec_(std::move(version_spec)) {}

Result<DependencyKey> DependencyKey::make(const std::string& name,
                                          const std::string& version_spec) {
    if (name.empty()) {
        return PinError{PinError::InvalidArg, "empty dependency name"};
    }
    if (name == "@") {
        return PinError{PinError::InvalidArg,
            "dependency name '@' has no package part"};
    }
    if (name.find(kDelimiter, 1) != std::string::npos) {
        return PinError{PinError::InvalidArg,
            "invalid dependency name '" + name + "'",
            "'@' is only allowed as the leading scope marker (e.g. @scope/pkg)"};
    }
    return Result<DependencyKey>::ok(DependencyKey(name, version_spec));
}

Result<DependencyKey> DependencyKey::parse(const std::string& canonical) {
    size_t at = canonical.find(kDelimiter, 1);
    if (canonical.empty() || at == std::string::npos) {
        return PinError{PinError::Parse,
            "missing dependency version in key '" + canonical + "'",
            "keys have the form name@version_spec"};
    }
    return Result<DependencyKey>::ok(
        DependencyKey(canonical.substr(0, at), canonical.substr(at + 1)));
}

std::string DependencyKey::to_string() const {
    std::string s;
    s.reserve(name_.size() + 1 + version_spec_.size());
    s += name_;
    s += kDelimiter;
    s += version_spec_;
    return s;
}

bool DependencyKey::operator==(const DependencyKey& o) const {
    return to_string() == o.to_string();
}

bool DependencyKey::operator!=(const DependencyKey& o) const {
    return !(*this == o);
}

bool DependencyKey::operator<(const DependencyKey& o) const {
    return to_string() < o.to_string();
}

} // namespace pinlock
