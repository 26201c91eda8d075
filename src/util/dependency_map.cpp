#include <pinlock/dependency_map.hpp>
#include <pinlock/integrity.hpp>
#include <pinlock/log.hpp>
#include <pinlock/version.hpp>
#include <nlohmann/json.hpp>

namespace pinlock {

// Field names in the on-disk record. The digest field is called "sha1" for
// every algorithm; older lock files use that name.
static constexpr const char* kFieldName = "name";
static constexpr const char* kFieldVersion = "version";
static constexpr const char* kFieldTarball = "tarball";
static constexpr const char* kFieldIntegrity = "sha1";

// ---------------------------------------------------------------------------
// LockedDependency
// ---------------------------------------------------------------------------

Status LockedDependency::validate() const {
    if (name.empty()) {
        return PinError{PinError::InvalidArg, "locked dependency has no name"};
    }
    auto v = Version::parse(version);
    if (v.is_err()) {
        auto err = std::move(v).error();
        err.message = "dependency '" + name + "': " + err.message;
        return err;
    }
    if (tarball.empty()) {
        return PinError{PinError::InvalidArg,
            "dependency '" + name + "@" + version + "' has no tarball URL"};
    }
    auto parsed = Integrity::parse(integrity);
    if (parsed.is_err()) {
        auto err = std::move(parsed).error();
        err.message = "dependency '" + name + "@" + version + "': " + err.message;
        return err;
    }
    return ok_status();
}

bool LockedDependency::operator==(const LockedDependency& o) const {
    return name == o.name && version == o.version &&
           tarball == o.tarball && integrity == o.integrity;
}

bool LockedDependency::operator!=(const LockedDependency& o) const {
    return !(*this == o);
}

// ---------------------------------------------------------------------------
// DependencyMap
// ---------------------------------------------------------------------------

bool DependencyMap::upsert(DependencyKey key, LockedDependency dep) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second = std::move(dep);
        return true;
    }
    entries_.emplace(std::move(key), std::move(dep));
    return false;
}

bool DependencyMap::erase(const DependencyKey& key) {
    return entries_.erase(key) > 0;
}

const LockedDependency* DependencyMap::find(const DependencyKey& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

DependencyMap::Sorted DependencyMap::sorted() const {
    return Sorted(entries_.begin(), entries_.end());
}

Result<std::string> DependencyMap::to_json() const {
    // ordered_json keeps insertion order, so the object comes out exactly in
    // the order of the sorted projection and fields in declaration order.
    nlohmann::ordered_json root = nlohmann::ordered_json::object();
    for (const auto& [key, dep] : sorted()) {
        // Every written key must decode back to itself, or load() would
        // reject the whole file.
        std::string canonical = key.to_string();
        auto decoded = DependencyKey::parse(canonical);
        if (key.name().empty() || decoded.is_err() || decoded.value() != key ||
            decoded.value().name() != key.name()) {
            return PinError{PinError::Encode,
                "cannot serialize dependency key '" + canonical + "'",
                "build keys with DependencyKey::make to validate the name"};
        }

        nlohmann::ordered_json rec = nlohmann::ordered_json::object();
        rec[kFieldName] = dep.name;
        rec[kFieldVersion] = dep.version;
        rec[kFieldTarball] = dep.tarball;
        rec[kFieldIntegrity] = dep.integrity;
        root[key.to_string()] = std::move(rec);
    }

    try {
        return Result<std::string>::ok(root.dump(2) + "\n");
    } catch (const nlohmann::json::exception& e) {
        return PinError{PinError::Encode,
            std::string("cannot serialize lock file: ") + e.what()};
    }
}

static Result<std::string> read_field(const nlohmann::json& rec,
                                      const char* field,
                                      const std::string& key) {
    auto it = rec.find(field);
    if (it == rec.end()) {
        return PinError{PinError::Decode,
            "entry '" + key + "' is missing field '" + field + "'"};
    }
    if (!it->is_string()) {
        return PinError{PinError::Decode,
            "field '" + std::string(field) + "' of entry '" + key +
            "' must be a string"};
    }
    return Result<std::string>::ok(it->get<std::string>());
}

Result<DependencyMap> DependencyMap::from_json(const std::string& text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return PinError{PinError::Decode,
            std::string("lock file is not valid JSON: ") + e.what()};
    }

    if (!doc.is_object()) {
        return PinError{PinError::Decode,
            "lock file must contain a JSON object",
            "expected { \"name@version_spec\": { ... }, ... }"};
    }

    DependencyMap out;
    out.reserve(doc.size());

    for (const auto& [raw_key, rec] : doc.items()) {
        auto key = DependencyKey::parse(raw_key);
        if (key.is_err()) {
            return PinError{PinError::Decode,
                "invalid dependency key: " + key.error().message,
                key.error().hint};
        }
        if (!rec.is_object()) {
            return PinError{PinError::Decode,
                "entry '" + raw_key + "' must be a JSON object"};
        }

        auto name = read_field(rec, kFieldName, raw_key);
        PINLOCK_TRY(name);
        auto version = read_field(rec, kFieldVersion, raw_key);
        PINLOCK_TRY(version);
        auto tarball = read_field(rec, kFieldTarball, raw_key);
        PINLOCK_TRY(tarball);
        auto digest = read_field(rec, kFieldIntegrity, raw_key);
        PINLOCK_TRY(digest);

        if (rec.size() > 4) {
            log::debug("ignoring unknown fields in lock entry '%s'", raw_key.c_str());
        }

        LockedDependency dep;
        dep.name = std::move(name).value();
        dep.version = std::move(version).value();
        dep.tarball = std::move(tarball).value();
        dep.integrity = std::move(digest).value();
        out.upsert(std::move(key).value(), std::move(dep));
    }

    return Result<DependencyMap>::ok(std::move(out));
}

} // namespace pinlock
