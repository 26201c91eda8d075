#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace pinlock {

// SHA-1 (FIPS 180-4). Only used for the legacy integrity format; not for
// anything security sensitive.
class SHA1 {
public:
    static constexpr size_t digest_size = 20;
    using Digest = std::array<uint8_t, digest_size>;

    SHA1();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Object should not be reused after this call.
    Digest finalize();

    static std::string hash_hex(const std::string& input);

private:
    void process_block(const uint8_t block[64]);

    std::array<uint32_t, 5> state_;
    uint64_t total_bytes_;
    uint8_t  buffer_[64];
    size_t   buffer_len_;
};

} // namespace pinlock
