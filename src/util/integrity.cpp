#include <pinlock/integrity.hpp>
#include <pinlock/encoding.hpp>
#include <pinlock/log.hpp>
#include <pinlock/sha1.hpp>
#include <pinlock/sha512.hpp>
#include <fstream>

namespace pinlock {

const char* algorithm_name(Algorithm alg) {
    switch (alg) {
        case Algorithm::Sha1:   return "sha1";
        case Algorithm::Sha256: return "sha256";
        case Algorithm::Sha384: return "sha384";
        case Algorithm::Sha512: return "sha512";
    }
    return "unknown";
}

Result<Algorithm> parse_algorithm(const std::string& name) {
    for (Algorithm alg : {Algorithm::Sha1, Algorithm::Sha256,
                          Algorithm::Sha384, Algorithm::Sha512}) {
        if (name == algorithm_name(alg)) {
            return Result<Algorithm>::ok(alg);
        }
    }
    return PinError{PinError::InvalidArg,
        "unknown integrity algorithm '" + name + "'",
        "expected one of: sha1, sha256, sha384, sha512"};
}

Result<Integrity> Integrity::parse(const std::string& s) {
    size_t dash = s.find('-');
    if (dash == std::string::npos) {
        return PinError{PinError::HashParse,
            "malformed integrity string '" + s + "'",
            "expected <algorithm>-<digest>"};
    }

    auto alg = parse_algorithm(s.substr(0, dash));
    if (alg.is_err()) {
        return PinError{PinError::HashParse,
            "unknown algorithm in integrity string '" + s + "'"};
    }

    std::string digest = s.substr(dash + 1);
    if (digest.empty()) {
        return PinError{PinError::HashParse,
            "empty digest in integrity string '" + s + "'"};
    }

    // sha512 labels in a lock file carry the lowercase hex digest
    if (alg.value() == Algorithm::Sha512) {
        if (digest.size() != SHA512::digest_size * 2) {
            return PinError{PinError::HashParse,
                "sha512 digest in '" + s + "' must be " +
                std::to_string(SHA512::digest_size * 2) + " hex characters"};
        }
        for (char c : digest) {
            if (!is_hex_char(c)) {
                return PinError{PinError::HashParse,
                    "invalid character '" + std::string(1, c) +
                    "' in integrity digest '" + s + "'"};
            }
        }
        Integrity out;
        out.algorithm = Algorithm::Sha512;
        out.digest = std::move(digest);
        return Result<Integrity>::ok(std::move(out));
    }

    // Base64 body with at most two trailing '=' characters
    size_t body_len = digest.size();
    while (body_len > 0 && digest.size() - body_len < 2 &&
           digest[body_len - 1] == '=') {
        --body_len;
    }
    if (body_len == 0) {
        return PinError{PinError::HashParse,
            "empty digest in integrity string '" + s + "'"};
    }
    for (size_t i = 0; i < body_len; ++i) {
        if (!is_base64_char(digest[i])) {
            return PinError{PinError::HashParse,
                "invalid character '" + std::string(1, digest[i]) +
                "' in integrity digest '" + s + "'"};
        }
    }

    Integrity out;
    out.algorithm = alg.value();
    out.digest = std::move(digest);
    return Result<Integrity>::ok(std::move(out));
}

std::string Integrity::to_string() const {
    return std::string(algorithm_name(algorithm)) + "-" + digest;
}

namespace integrity {

static Result<std::string> format_sha1(const SHA1::Digest& digest) {
    std::string label = "sha1-" + base64_encode(to_hex(digest));

    // Round-trip through the parser so a broken encoder can never write an
    // unreadable label into a lock file.
    auto parsed = Integrity::parse(label);
    if (parsed.is_err() || parsed.value().to_string() != label) {
        return PinError{PinError::HashParse,
            "computed integrity '" + label + "' failed to parse"};
    }
    auto body = base64_decode(parsed.value().digest);
    if (body.is_err() || body.value() != to_hex(digest)) {
        return PinError{PinError::HashParse,
            "computed integrity '" + label + "' does not decode to its digest"};
    }
    return Result<std::string>::ok(std::move(label));
}

static std::string format_sha512(const SHA512::Digest& digest) {
    return "sha512-" + to_hex(digest);
}

Result<std::string> compute(const uint8_t* data, size_t len, Algorithm alg) {
    switch (alg) {
        case Algorithm::Sha1: {
            SHA1 ctx;
            ctx.update(data, len);
            return format_sha1(ctx.finalize());
        }
        case Algorithm::Sha512: {
            SHA512 ctx;
            ctx.update(data, len);
            return Result<std::string>::ok(format_sha512(ctx.finalize()));
        }
        default:
            log::debug("integrity algorithm %s is not supported, returning empty digest",
                       algorithm_name(alg));
            return Result<std::string>::ok(std::string());
    }
}

Result<std::string> compute(const std::string& bytes, Algorithm alg) {
    return compute(reinterpret_cast<const uint8_t*>(bytes.data()),
                   bytes.size(), alg);
}

Result<std::string> compute_strict(const std::string& bytes, Algorithm alg) {
    auto label = compute(bytes, alg);
    PINLOCK_TRY(label);
    if (label.value().empty()) {
        return PinError{PinError::InvalidArg,
            std::string("cannot compute ") + algorithm_name(alg) + " integrity",
            "supported algorithms: sha1, sha512"};
    }
    return label;
}

template<typename Hasher>
static Status copy_into(std::istream& in, Hasher& ctx) {
    if (!in.good()) {
        return PinError{PinError::HashCopy,
            "input stream is not readable"};
    }
    char buf[8192];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        ctx.update(reinterpret_cast<const uint8_t*>(buf),
                   static_cast<size_t>(in.gcount()));
    }
    if (in.bad()) {
        return PinError{PinError::HashCopy,
            "read error while feeding bytes to the hasher"};
    }
    return ok_status();
}

Result<std::string> compute_stream(std::istream& in, Algorithm alg) {
    switch (alg) {
        case Algorithm::Sha1: {
            SHA1 ctx;
            PINLOCK_TRY(copy_into(in, ctx));
            return format_sha1(ctx.finalize());
        }
        case Algorithm::Sha512: {
            SHA512 ctx;
            PINLOCK_TRY(copy_into(in, ctx));
            return Result<std::string>::ok(format_sha512(ctx.finalize()));
        }
        default:
            return Result<std::string>::ok(std::string());
    }
}

Result<std::string> compute_file(const std::filesystem::path& path, Algorithm alg) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return PinError{PinError::IO,
            "cannot open file for hashing: " + path.string()};
    }
    return compute_stream(in, alg).at_file(path.string());
}

Status verify(const std::string& bytes, const std::string& expected) {
    auto parsed = Integrity::parse(expected);
    PINLOCK_TRY(parsed);

    auto actual = compute_strict(bytes, parsed.value().algorithm);
    PINLOCK_TRY(actual);

    if (actual.value() != expected) {
        return PinError{PinError::Checksum,
            "integrity mismatch: expected " + expected + ", got " + actual.value(),
            "the downloaded archive does not match the lock file; "
            "delete the entry to re-resolve it"};
    }
    log::trace("integrity ok: %s", expected.c_str());
    return ok_status();
}

} // namespace integrity

} // namespace pinlock
