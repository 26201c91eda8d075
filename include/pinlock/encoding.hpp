#pragma once

#include <pinlock/result.hpp>
#include <cstdint>
#include <cstddef>
#include <string>

namespace pinlock {

// Lowercase hex, two characters per byte.
std::string to_hex(const uint8_t* data, size_t len);

template<typename Bytes>
std::string to_hex(const Bytes& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

// Standard alphabet (RFC 4648 section 4) with '=' padding.
std::string base64_encode(const std::string& input);
Result<std::string> base64_decode(const std::string& input);

bool is_base64_char(char c);
bool is_hex_char(char c);

} // namespace pinlock
