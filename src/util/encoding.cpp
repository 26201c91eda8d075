#include <pinlock/encoding.hpp>

namespace pinlock {

static const char hex_chars[] = "0123456789abcdef";
static const char b64_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string to_hex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += hex_chars[data[i] >> 4];
        out += hex_chars[data[i] & 0x0f];
    }
    return out;
}

bool is_hex_char(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')
        || (c >= 'A' && c <= 'F');
}

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
        || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

static int b64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string base64_encode(const std::string& input) {
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= input.size(); i += 3) {
        uint32_t n = (uint32_t(uint8_t(input[i])) << 16)
                   | (uint32_t(uint8_t(input[i + 1])) << 8)
                   | uint32_t(uint8_t(input[i + 2]));
        out += b64_chars[(n >> 18) & 0x3f];
        out += b64_chars[(n >> 12) & 0x3f];
        out += b64_chars[(n >> 6) & 0x3f];
        out += b64_chars[n & 0x3f];
    }

    size_t rest = input.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t(uint8_t(input[i])) << 16;
        out += b64_chars[(n >> 18) & 0x3f];
        out += b64_chars[(n >> 12) & 0x3f];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(uint8_t(input[i])) << 16)
                   | (uint32_t(uint8_t(input[i + 1])) << 8);
        out += b64_chars[(n >> 18) & 0x3f];
        out += b64_chars[(n >> 12) & 0x3f];
        out += b64_chars[(n >> 6) & 0x3f];
        out += '=';
    }
    return out;
}

Result<std::string> base64_decode(const std::string& input) {
    if (input.size() % 4 != 0) {
        return PinError{PinError::Parse,
            "base64 input length " + std::to_string(input.size()) +
            " is not a multiple of 4"};
    }

    size_t padding = 0;
    if (!input.empty() && input.back() == '=') ++padding;
    if (input.size() > 1 && input[input.size() - 2] == '=') ++padding;

    std::string out;
    out.reserve(input.size() / 4 * 3);

    for (size_t i = 0; i < input.size(); i += 4) {
        bool last = (i + 4 == input.size());
        uint32_t n = 0;
        for (size_t j = 0; j < 4; ++j) {
            char c = input[i + j];
            int v;
            if (c == '=' && last && j >= 4 - padding) {
                v = 0;
            } else {
                v = b64_value(c);
            }
            if (v < 0) {
                return PinError{PinError::Parse,
                    "invalid base64 character '" + std::string(1, c) + "'"};
            }
            n = (n << 6) | uint32_t(v);
        }
        out += char((n >> 16) & 0xff);
        if (!last || padding < 2) out += char((n >> 8) & 0xff);
        if (!last || padding < 1) out += char(n & 0xff);
    }

    return Result<std::string>::ok(std::move(out));
}

} // namespace pinlock
