#include <catch2/catch.hpp>
#include <pinlock/project.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace pinlock;

namespace fs = std::filesystem;

static fs::path temp_dir() {
    const char* src = std::getenv("PINLOCK_SOURCE_DIR");
    fs::path base = src ? fs::path(src) / "build" : fs::temp_directory_path();
    fs::path dir = base / "test_project_tmp";
    fs::remove_all(dir);
    fs::create_directories(dir);
    return fs::canonical(dir);
}

static void touch(const fs::path& p, const std::string& content = "{}") {
    std::ofstream out(p);
    out << content;
}

TEST_CASE("lockfile_path joins root and configured name", "[project]") {
    Config cfg;
    REQUIRE(lockfile_path("/work/app", cfg) == fs::path("/work/app/pin.lock"));
    cfg.lockfile_name = "deps.lock";
    REQUIRE(lockfile_path("/work/app", cfg) == fs::path("/work/app/deps.lock"));
}

TEST_CASE("find_lockfile walks up to the project root", "[project]") {
    fs::path root = temp_dir();
    fs::path nested = root / "src" / "components";
    fs::create_directories(nested);
    touch(root / "pin.lock");

    auto r = find_lockfile(nested, Config{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == root / "pin.lock");
}

TEST_CASE("find_lockfile prefers the nearest lock file", "[project]") {
    fs::path root = temp_dir();
    fs::path member = root / "packages" / "ui";
    fs::create_directories(member);
    touch(root / "pin.lock");
    touch(member / "pin.lock");

    auto r = find_lockfile(member, Config{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == member / "pin.lock");
}

TEST_CASE("find_lockfile reports NotFound", "[project]") {
    fs::path root = temp_dir();
    Config cfg;
    cfg.lockfile_name = "surely-absent-7f3a.lock";

    auto r = find_lockfile(root, cfg);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinError::NotFound);
}

TEST_CASE("load_config reads the project layer", "[project]") {
    fs::path root = temp_dir();
    touch(root / kProjectConfigName, "[lockfile]\nname = \"app.lock\"\n");

    auto r = load_config(root);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().lockfile_name == "app.lock");
}

TEST_CASE("load_config surfaces a malformed project config", "[project]") {
    fs::path root = temp_dir();
    touch(root / kProjectConfigName, "[lockfile\n");

    auto r = load_config(root);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinError::Parse);
    REQUIRE(r.error().file == (root / kProjectConfigName).string());
}
