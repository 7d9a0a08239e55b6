#include <pathmatch/error.hpp>

namespace pathmatch {

const char* PathmatchError::code_name(Code c) {
    switch (c) {
        case IO:             return "IO";
        case Parse:          return "Parse";
        case Config:         return "Config";
        case Pattern:        return "Pattern";
        case UnusedPatterns: return "UnusedPatterns";
        case Duplicate:      return "Duplicate";
    }
    return "Unknown";
}

std::string PathmatchError::format() const {
    std::string result = "[";
    result += code_name(code);
    result += "] ";
    result += message;

    for (const auto& d : details) {
        result += "\n  - ";
        result += d;
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace pathmatch
