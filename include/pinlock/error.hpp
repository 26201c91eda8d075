#pragma once

#include <string>

namespace pinlock {

struct PinError {
    enum Code {
        IO,
        Decode,
        Encode,
        HashCopy,
        HashParse,
        Parse,
        Version,
        Config,
        Checksum,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    PinError() = default;
    PinError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PinError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    PinError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace pinlock
