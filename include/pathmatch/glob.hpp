#pragma once

#include <pathmatch/result.hpp>
#include <string>
#include <vector>
#include <utility>

namespace pathmatch {

// A compiled gitignore-style wildcard pattern, matched against a whole
// '/'-separated path.
//
// Supports: * (any chars except /), ? (single char except /),
//           ** as a full segment (zero or more path segments; a trailing
//           "/**" matches one or more, so "a/**" matches inside a but not a),
//           [abc], [a-z], [!0-9] / [^0-9], [[:alpha:]] and the other POSIX
//           classes, and \x for a literal x.
// A leading '/' is accepted and ignored since patterns are always anchored
// at the start of the path. A trailing '/' is kept and only matches a path
// that itself ends in '/'.
class GlobPattern {
public:
    static Result<GlobPattern> compile(const std::string& pattern);

    bool match(const std::string& path) const;

    const std::string& source() const { return source_; }

    using CharPredicate = int (*)(int);

    struct Token {
        enum Kind { Literal, AnyChar, Star, Class };
        Kind kind = Literal;
        char ch = 0;
        // Class members; bytes compare as unsigned char
        bool negate = false;
        std::vector<std::pair<unsigned char, unsigned char>> ranges;
        std::vector<CharPredicate> named;  // [:alpha:] and friends
    };

    struct Segment {
        bool double_star = false;
        std::vector<Token> tokens;
    };

private:
    std::string source_;
    std::vector<Segment> segments_;
};

// Check if pattern is a negation pattern (prefixed with '!').
// If so, stores the inner pattern (without '!') in `inner` and returns true.
bool glob_is_negation(const std::string& pattern, std::string& inner);

} // namespace pathmatch
