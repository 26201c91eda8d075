// demo_lock.cpp
//
// Digest a downloaded archive and pin it in the project's lock file.
//
//     ./demo_lock <archive.tgz> <name@version_spec> <version> <tarball-url>
//
// The lock file is <cwd>/pin.lock unless .pinlock.toml says otherwise.
// Run it twice with the same key to see the entry replaced; run it with a
// range as <version> to see a validation error.

#include <pinlock/config.hpp>
#include <pinlock/integrity.hpp>
#include <pinlock/lockfile.hpp>
#include <pinlock/log.hpp>
#include <pinlock/project.hpp>
#include <pinlock/result.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace pinlock;

struct Args {
    std::string archive;
    std::string key;
    std::string version;
    std::string tarball;
};

static Result<Args> parse_args(int argc, char** argv) {
    if (argc < 5) {
        return PinError{
            PinError::InvalidArg,
            "expected 4 arguments, got " + std::to_string(argc - 1),
            "usage: demo_lock <archive> <name@version_spec> <version> <tarball-url>"
        };
    }
    return Result<Args>::ok(Args{argv[1], argv[2], argv[3], argv[4]});
}

// Existing lock file if there is one, otherwise a fresh one at the same path
static Result<LockFile> open_lockfile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        log::info("creating %s", path.string().c_str());
        return Result<LockFile>::ok(LockFile(path));
    }
    return LockFile::load(path);
}

static Status run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    PINLOCK_TRY(args);
    const Args& a = args.value();

    fs::path root = fs::current_path();
    auto cfg = load_config(root);
    PINLOCK_TRY(cfg);
    cfg.value().apply_logging();

    auto key = DependencyKey::parse(a.key);
    PINLOCK_TRY(key);

    auto digest = integrity::compute_file(a.archive, cfg.value().algorithm);
    PINLOCK_TRY(digest);
    log::info("%s: %s", a.archive.c_str(), digest.value().c_str());

    auto lf = open_lockfile(lockfile_path(root, cfg.value()));
    PINLOCK_TRY(lf);

    const LockedDependency* prev = lf.value().find(key.value());
    if (prev && prev->integrity == digest.value()) {
        log::info("%s already locked at %s", a.key.c_str(), prev->version.c_str());
        return ok_status();
    }

    LockedDependency dep;
    dep.name = key.value().name();
    dep.version = a.version;
    dep.tarball = a.tarball;
    dep.integrity = digest.value();
    PINLOCK_TRY(lf.value().add_checked(key.value(), std::move(dep)));

    PINLOCK_TRY(lf.value().save());
    std::cout << "locked " << a.key << " (" << lf.value().size()
              << " entries in " << lf.value().path().string() << ")\n";
    return ok_status();
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
