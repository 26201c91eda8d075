#include <catch2/catch.hpp>
#include <pinlock/config.hpp>

using namespace pinlock;

// ===== Parsing =====

TEST_CASE("parse config with every section", "[config]") {
    auto r = Config::parse(R"(
[lockfile]
name = "deps.lock"

[integrity]
algorithm = "sha512"

[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().lockfile_name == "deps.lock");
    REQUIRE(r.value().algorithm == Algorithm::Sha512);
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().log_color == false);
    REQUIRE(r.value().log_color_set);
}

TEST_CASE("parse empty config keeps defaults", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().lockfile_name == "pin.lock");
    REQUIRE(r.value().algorithm == Algorithm::Sha1);
    REQUIRE(r.value().log_level == log::Info);
    REQUIRE_FALSE(r.value().lockfile_name_set);
    REQUIRE_FALSE(r.value().algorithm_set);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinError::Parse);
}

TEST_CASE("unsupported algorithm is a Config error", "[config]") {
    auto r = Config::parse("[integrity]\nalgorithm = \"sha256\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinError::Config);

    auto md5 = Config::parse("[integrity]\nalgorithm = \"md5\"\n");
    REQUIRE(md5.is_err());
    REQUIRE(md5.error().code == PinError::Config);
}

TEST_CASE("unknown log level is a Config error", "[config]") {
    auto r = Config::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinError::Config);
}

TEST_CASE("lockfile name must be a bare file name", "[config]") {
    REQUIRE(Config::parse("[lockfile]\nname = \"\"\n").is_err());
    REQUIRE(Config::parse("[lockfile]\nname = \"sub/pin.lock\"\n").is_err());

    for (const char* dots : {".", ".."}) {
        auto r = Config::parse(std::string("[lockfile]\nname = \"") + dots + "\"\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PinError::Config);
    }
    REQUIRE(Config::parse("[lockfile]\nname = \".pin.lock\"\n").is_ok());
}

TEST_CASE("load missing config is an IO error", "[config]") {
    auto r = Config::load("/nonexistent/.pinlock.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinError::IO);
}

// ===== Merging =====

TEST_CASE("merge overrides only explicitly set fields", "[config]") {
    auto global = Config::parse(R"(
[integrity]
algorithm = "sha512"
[log]
level = "warn"
)").value();
    auto project = Config::parse(R"(
[lockfile]
name = "project.lock"
[log]
level = "trace"
)").value();

    Config eff = Config::effective(global, project);
    REQUIRE(eff.lockfile_name == "project.lock");
    REQUIRE(eff.algorithm == Algorithm::Sha512);
    REQUIRE(eff.log_level == log::Trace);
}

TEST_CASE("effective with no layers is the default config", "[config]") {
    Config eff = Config::effective(std::nullopt, std::nullopt);
    REQUIRE(eff.lockfile_name == "pin.lock");
    REQUIRE(eff.algorithm == Algorithm::Sha1);
}

TEST_CASE("apply_logging sets the logger level", "[config]") {
    auto saved = log::get_level();
    auto cfg = Config::parse("[log]\nlevel = \"error\"\n").value();
    cfg.apply_logging();
    REQUIRE(log::get_level() == log::Error);
    log::set_level(saved);
}
