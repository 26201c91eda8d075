#include <pinlock/error.hpp>

namespace pinlock {

const char* PinError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Decode:     return "Decode";
        case Encode:     return "Encode";
        case HashCopy:   return "HashCopy";
        case HashParse:  return "HashParse";
        case Parse:      return "Parse";
        case Version:    return "Version";
        case Config:     return "Config";
        case Checksum:   return "Checksum";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

// "<file>[:<line>]: error[<Code>]: <message>", then an indented hint line.
std::string PinError::format() const {
    std::string out;
    if (!file.empty()) {
        out += file;
        if (line > 0) out += ":" + std::to_string(line);
        out += ": ";
    }
    out += std::string("error[") + code_name(code) + "]: " + message;
    if (!hint.empty()) out += "\n  = hint: " + hint;
    return out;
}

} // namespace pinlock
