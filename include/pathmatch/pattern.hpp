#pragma once

#include <pathmatch/glob.hpp>
#include <pathmatch/result.hpp>
#include <string>
#include <vector>
#include <cstddef>

namespace pathmatch {

// One compiled line of a pattern source.
struct Pattern {
    std::string text;      // stripped line, including any leading '!'
    bool negation = false;
    GlobPattern compiled;
    size_t index = 0;      // position in the compiled list; identifies the pattern
};

// Patterns used when no pattern source is given: select everything.
std::vector<std::string> default_pattern_lines();

// Compile pattern-source lines in order. Blank lines and '#' comments are
// skipped; a line starting with '!' is a negation of the rest of the line.
// Any line the glob compiler rejects fails the whole call.
Result<std::vector<Pattern>> compile_patterns(const std::vector<std::string>& lines);

// Read a pattern file into lines (no compilation).
Result<std::vector<std::string>> read_pattern_lines(const std::string& path);

} // namespace pathmatch
