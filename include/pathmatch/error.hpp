#pragma once

#include <string>
#include <utility>
#include <vector>

namespace pathmatch {

struct PathmatchError {
    enum Code {
        IO,
        Parse,
        Config,
        Pattern,
        UnusedPatterns,
        Duplicate
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    // Extra diagnostic lines, e.g. the offending pattern strings
    std::vector<std::string> details;

    PathmatchError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PathmatchError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace pathmatch
