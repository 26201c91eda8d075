#pragma once

#include <pinlock/result.hpp>
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>

namespace pinlock {

// Algorithms that may appear in an integrity string. Only Sha1 and Sha512
// can be computed; the others are recognised when parsing.
enum class Algorithm { Sha1, Sha256, Sha384, Sha512 };

const char* algorithm_name(Algorithm alg);
Result<Algorithm> parse_algorithm(const std::string& name);

// Tagged integrity label: "<algorithm>-<digest>"
struct Integrity {
    Algorithm algorithm = Algorithm::Sha512;
    std::string digest;

    // Checks the algorithm token and that the digest is non-empty base64
    // (which covers lowercase hex as well). Errors are HashParse.
    static Result<Integrity> parse(const std::string& s);
    std::string to_string() const;
};

namespace integrity {

// Digest `bytes` and return the tagged integrity string.
//
//   Sha1   -> "sha1-" + base64(lowercase_hex(sha1(bytes)))
//   Sha512 -> "sha512-" + lowercase_hex(sha512(bytes))
//
// The sha1 form base64-encodes the hex *text*, not the raw digest. Existing
// lock files depend on it, so it must not be "fixed".
//
// Any other algorithm yields an empty string rather than an error; callers
// check for empty() to detect it. compute_strict() reports it instead.
Result<std::string> compute(const uint8_t* data, size_t len, Algorithm alg);
Result<std::string> compute(const std::string& bytes, Algorithm alg);

// Same as compute() but unsupported algorithms are an InvalidArg error.
Result<std::string> compute_strict(const std::string& bytes, Algorithm alg);

// Digest everything readable from `in`. A read failure is a HashCopy error.
Result<std::string> compute_stream(std::istream& in, Algorithm alg);
Result<std::string> compute_file(const std::filesystem::path& path, Algorithm alg);

// Recompute with the algorithm named in `expected` and compare.
// Checksum error on mismatch, InvalidArg if the algorithm can't be computed.
Status verify(const std::string& bytes, const std::string& expected);

} // namespace integrity

} // namespace pinlock
