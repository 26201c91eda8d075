#include <catch2/catch.hpp>
#include <pinlock/dependency_map.hpp>
#include <pinlock/integrity.hpp>

#include <string>
#include <vector>

using namespace pinlock;

static LockedDependency make_dep(const std::string& name,
                                 const std::string& version) {
    LockedDependency d;
    d.name = name;
    d.version = version;
    d.tarball = "https://registry.npmjs.org/" + name + "/-/" + name + "-" +
                version + ".tgz";
    d.integrity = integrity::compute(name + version, Algorithm::Sha1).value();
    return d;
}

// ===== LockedDependency::validate =====

TEST_CASE("validate accepts a complete record", "[dependency_map]") {
    REQUIRE(make_dep("react", "18.2.0").validate().is_ok());
}

TEST_CASE("validate rejects a range version", "[dependency_map]") {
    auto d = make_dep("react", "18.2.0");
    d.version = "^18.2.0";
    auto r = d.validate();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinError::Version);
    REQUIRE(r.error().message.find("react") != std::string::npos);
}

TEST_CASE("validate rejects missing fields", "[dependency_map]") {
    auto no_name = make_dep("react", "18.2.0");
    no_name.name.clear();
    REQUIRE(no_name.validate().error().code == PinError::InvalidArg);

    auto no_tarball = make_dep("react", "18.2.0");
    no_tarball.tarball.clear();
    REQUIRE(no_tarball.validate().error().code == PinError::InvalidArg);

    auto bad_digest = make_dep("react", "18.2.0");
    bad_digest.integrity = "not a digest";
    REQUIRE(bad_digest.validate().error().code == PinError::HashParse);
}

// ===== upsert / find / erase =====

TEST_CASE("upsert replaces the record for an existing key", "[dependency_map]") {
    DependencyMap m;
    DependencyKey key("react", "^18.0.0");

    REQUIRE_FALSE(m.upsert(key, make_dep("react", "18.0.0")));
    REQUIRE(m.upsert(key, make_dep("react", "18.2.0")));

    REQUIRE(m.size() == 1);
    REQUIRE(m.find(key) != nullptr);
    REQUIRE(m.find(key)->version == "18.2.0");
}

TEST_CASE("find miss and erase", "[dependency_map]") {
    DependencyMap m;
    DependencyKey key("react", "^18.0.0");
    m.upsert(key, make_dep("react", "18.0.0"));

    REQUIRE(m.find(DependencyKey("react", "^17.0.0")) == nullptr);
    REQUIRE(m.contains(key));
    REQUIRE(m.erase(key));
    REQUIRE_FALSE(m.erase(key));
    REQUIRE(m.empty());
}

// ===== to_json =====

TEST_CASE("to_json writes entries in key order", "[dependency_map]") {
    DependencyMap m;
    m.upsert(DependencyKey("zod", "^3.0.0"), make_dep("zod", "3.22.4"));
    m.upsert(DependencyKey("axios", "^1.0.0"), make_dep("axios", "1.6.2"));
    m.upsert(DependencyKey("@types/node", "^20.0.0"), make_dep("@types/node", "20.10.0"));

    auto json = m.to_json();
    REQUIRE(json.is_ok());
    const std::string& text = json.value();

    auto scoped = text.find("\"@types/node@^20.0.0\"");
    auto axios = text.find("\"axios@^1.0.0\"");
    auto zod = text.find("\"zod@^3.0.0\"");
    REQUIRE(scoped != std::string::npos);
    REQUIRE(scoped < axios);
    REQUIRE(axios < zod);
    REQUIRE(text.back() == '\n');
}

TEST_CASE("to_json record layout", "[dependency_map]") {
    DependencyMap m;
    LockedDependency d;
    d.name = "left-pad";
    d.version = "1.3.0";
    d.tarball = "https://registry.npmjs.org/left-pad/-/left-pad-1.3.0.tgz";
    d.integrity = "sha512-abc";
    m.upsert(DependencyKey("left-pad", "^1.3.0"), d);

    std::string expected =
        "{\n"
        "  \"left-pad@^1.3.0\": {\n"
        "    \"name\": \"left-pad\",\n"
        "    \"version\": \"1.3.0\",\n"
        "    \"tarball\": \"https://registry.npmjs.org/left-pad/-/left-pad-1.3.0.tgz\",\n"
        "    \"sha1\": \"sha512-abc\"\n"
        "  }\n"
        "}\n";
    REQUIRE(m.to_json().value() == expected);
}

TEST_CASE("empty map serializes to an empty object", "[dependency_map]") {
    DependencyMap m;
    REQUIRE(m.to_json().value() == "{}\n");
}

TEST_CASE("to_json is independent of insertion order", "[dependency_map]") {
    std::vector<std::pair<DependencyKey, LockedDependency>> entries;
    for (int i = 0; i < 50; ++i) {
        std::string name = "pkg" + std::to_string((i * 37) % 50);
        entries.emplace_back(DependencyKey(name, "^1.0.0"), make_dep(name, "1.0.0"));
    }

    DependencyMap forward;
    for (const auto& [k, v] : entries) forward.upsert(k, v);

    DependencyMap backward;
    backward.reserve(128);
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        backward.upsert(it->first, it->second);
    }

    REQUIRE(forward == backward);
    REQUIRE(forward.to_json().value() == backward.to_json().value());
}

TEST_CASE("to_json reports invalid UTF-8 as Encode", "[dependency_map]") {
    DependencyMap m;
    auto d = make_dep("bad", "1.0.0");
    d.tarball = std::string("https://example.com/\xff\xfe.tgz");
    m.upsert(DependencyKey("bad", "1.0.0"), d);

    auto r = m.to_json();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinError::Encode);
}

TEST_CASE("to_json refuses keys that would not decode", "[dependency_map]") {
    SECTION("empty name") {
        DependencyMap m;
        m.upsert(DependencyKey("", "1.0.0"), make_dep("x", "1.0.0"));
        auto r = m.to_json();
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PinError::Encode);
    }
    SECTION("interior @ in the name") {
        DependencyMap m;
        m.upsert(DependencyKey("a@b", "1.0.0"), make_dep("a", "1.0.0"));
        auto r = m.to_json();
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PinError::Encode);
    }
    SECTION("scoped name is fine") {
        DependencyMap m;
        m.upsert(DependencyKey("@types/node", "^20"), make_dep("@types/node", "20.1.0"));
        REQUIRE(m.to_json().is_ok());
    }
}

// ===== from_json =====

TEST_CASE("from_json accepts unsorted input", "[dependency_map]") {
    auto r = DependencyMap::from_json(R"JSON({
  "zod@^3.0.0": {"name": "zod", "version": "3.22.4",
                  "tarball": "https://r/zod.tgz", "sha1": "sha1-AAAA"},
  "axios@^1.0.0": {"sha1": "sha512-ff", "tarball": "https://r/axios.tgz",
                    "version": "1.6.2", "name": "axios"}
})JSON");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);

    auto* axios = r.value().find(DependencyKey("axios", "^1.0.0"));
    REQUIRE(axios != nullptr);
    REQUIRE(axios->version == "1.6.2");
    REQUIRE(axios->integrity == "sha512-ff");
}

TEST_CASE("from_json ignores unknown fields", "[dependency_map]") {
    auto r = DependencyMap::from_json(R"JSON({
  "a@1.0.0": {"name": "a", "version": "1.0.0", "tarball": "t",
              "sha1": "sha1-AA==", "resolved_at": 12}
})JSON");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
}

TEST_CASE("from_json rejects malformed content as Decode", "[dependency_map]") {
    std::vector<std::string> bad = {
        "",
        "{ not json",
        "[]",
        R"({"nodelimiter": {"name": "a", "version": "1", "tarball": "t", "sha1": "s"}})",
        R"({"a@1": "just a string"})",
        R"({"a@1": {"name": "a", "version": "1", "tarball": "t"}})",
        R"({"a@1": {"name": "a", "version": 1, "tarball": "t", "sha1": "s"}})",
    };
    for (const auto& text : bad) {
        INFO(text);
        auto r = DependencyMap::from_json(text);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PinError::Decode);
    }
}

TEST_CASE("to_json then from_json is equivalent", "[dependency_map]") {
    DependencyMap m;
    m.upsert(DependencyKey("react", "^18.0.0"), make_dep("react", "18.2.0"));
    m.upsert(DependencyKey("@scope/pkg", "~2.1.0"), make_dep("@scope/pkg", "2.1.3"));

    auto back = DependencyMap::from_json(m.to_json().value());
    REQUIRE(back.is_ok());
    REQUIRE(back.value() == m);
}
