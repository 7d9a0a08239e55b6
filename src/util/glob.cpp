#include <pathmatch/glob.hpp>
#include <cctype>

namespace pathmatch {

// ---- Helpers ----

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : s) {
        if (c == '/') {
            segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    segs.push_back(cur);
    return segs;
}

static PathmatchError bad_pattern(const std::string& pattern, const std::string& why) {
    return PathmatchError{PathmatchError::Pattern,
        "invalid pattern '" + pattern + "': " + why};
}

struct NamedClass {
    const char* name;
    GlobPattern::CharPredicate pred;
};

static const NamedClass kNamedClasses[] = {
    {"alnum",  [](int c) { return std::isalnum(c); }},
    {"alpha",  [](int c) { return std::isalpha(c); }},
    {"blank",  [](int c) { return std::isblank(c); }},
    {"cntrl",  [](int c) { return std::iscntrl(c); }},
    {"digit",  [](int c) { return std::isdigit(c); }},
    {"graph",  [](int c) { return std::isgraph(c); }},
    {"lower",  [](int c) { return std::islower(c); }},
    {"print",  [](int c) { return std::isprint(c); }},
    {"punct",  [](int c) { return std::ispunct(c); }},
    {"space",  [](int c) { return std::isspace(c); }},
    {"upper",  [](int c) { return std::isupper(c); }},
    {"xdigit", [](int c) { return std::isxdigit(c); }},
};

// Parse a character class starting just past '['. On success `pos` is left
// past the closing ']'.
static Result<GlobPattern::Token> parse_class(const std::string& pattern,
                                              const std::string& seg, size_t& pos) {
    GlobPattern::Token tok;
    tok.kind = GlobPattern::Token::Class;

    if (pos < seg.size() && (seg[pos] == '!' || seg[pos] == '^')) {
        tok.negate = true;
        pos++;
    }

    bool first = true;
    while (pos < seg.size()) {
        // A ']' right after the opening bracket is a member, not the terminator
        if (seg[pos] == ']' && !first) {
            pos++;
            return Result<GlobPattern::Token>::ok(std::move(tok));
        }
        first = false;

        if (seg.compare(pos, 2, "[:") == 0) {
            auto close = seg.find(":]", pos + 2);
            if (close == std::string::npos) break;
            std::string name = seg.substr(pos + 2, close - pos - 2);
            GlobPattern::CharPredicate pred = nullptr;
            for (const auto& nc : kNamedClasses) {
                if (name == nc.name) pred = nc.pred;
            }
            if (!pred) {
                return bad_pattern(pattern, "unknown character class [:" + name + ":]");
            }
            tok.named.push_back(pred);
            pos = close + 2;
            continue;
        }

        unsigned char lo = static_cast<unsigned char>(seg[pos]);
        if (lo == '\\') {
            if (pos + 1 >= seg.size()) break;
            lo = static_cast<unsigned char>(seg[++pos]);
        }
        pos++;

        unsigned char hi = lo;
        if (pos + 1 < seg.size() && seg[pos] == '-' && seg[pos + 1] != ']') {
            hi = static_cast<unsigned char>(seg[pos + 1]);
            pos += 2;
            if (hi == '\\') {
                if (pos >= seg.size()) break;
                hi = static_cast<unsigned char>(seg[pos++]);
            }
            if (hi < lo) {
                return bad_pattern(pattern, "reversed range in character class");
            }
        }
        tok.ranges.emplace_back(lo, hi);
    }

    return bad_pattern(pattern, "unterminated character class");
}

static Result<GlobPattern::Segment> compile_segment(const std::string& pattern,
                                                    const std::string& seg) {
    GlobPattern::Segment out;
    if (seg == "**") {
        out.double_star = true;
        return Result<GlobPattern::Segment>::ok(std::move(out));
    }

    size_t pos = 0;
    while (pos < seg.size()) {
        char c = seg[pos];
        GlobPattern::Token tok;

        if (c == '*') {
            // Consecutive stars inside a segment collapse to one
            while (pos < seg.size() && seg[pos] == '*') pos++;
            tok.kind = GlobPattern::Token::Star;
            out.tokens.push_back(std::move(tok));
            continue;
        }

        if (c == '?') {
            tok.kind = GlobPattern::Token::AnyChar;
            out.tokens.push_back(std::move(tok));
            pos++;
            continue;
        }

        if (c == '[') {
            pos++;
            auto cls = parse_class(pattern, seg, pos);
            if (cls.is_err()) return std::move(cls).error();
            out.tokens.push_back(std::move(cls).value());
            continue;
        }

        if (c == '\\') {
            if (pos + 1 >= seg.size()) {
                return bad_pattern(pattern, "trailing backslash");
            }
            c = seg[++pos];
        }

        tok.kind = GlobPattern::Token::Literal;
        tok.ch = c;
        out.tokens.push_back(std::move(tok));
        pos++;
    }

    return Result<GlobPattern::Segment>::ok(std::move(out));
}

static bool match_class(const GlobPattern::Token& tok, char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    bool matched = false;
    for (const auto& [lo, hi] : tok.ranges) {
        if (uc >= lo && uc <= hi) {
            matched = true;
            break;
        }
    }
    for (auto pred : tok.named) {
        if (matched) break;
        matched = pred(uc) != 0;
    }
    return tok.negate ? !matched : matched;
}

// Match one path segment against a compiled segment (no '/' in either).
static bool match_tokens(const std::vector<GlobPattern::Token>& toks, size_t ti,
                         const std::string& str, size_t si) {
    while (ti < toks.size()) {
        const auto& tok = toks[ti];

        if (tok.kind == GlobPattern::Token::Star) {
            ti++;
            // If pattern exhausted, star matches rest of segment
            if (ti == toks.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_tokens(toks, ti, str, k)) return true;
            }
            return false;
        }

        if (si >= str.size()) return false;

        switch (tok.kind) {
        case GlobPattern::Token::AnyChar:
            break;
        case GlobPattern::Token::Class:
            if (!match_class(tok, str[si])) return false;
            break;
        default:
            if (tok.ch != str[si]) return false;
            break;
        }
        ti++;
        si++;
    }

    return si == str.size();
}

// Recursive matching over path segments, handling '**'.
static bool match_segments(const std::vector<GlobPattern::Segment>& pat_segs, size_t pi,
                           const std::vector<std::string>& path_segs, size_t si) {
    while (pi < pat_segs.size() && si < path_segs.size()) {
        const auto& ps = pat_segs[pi];

        if (ps.double_star) {
            // Collapse consecutive '**' segments
            while (pi < pat_segs.size() && pat_segs[pi].double_star) pi++;
            // If pattern exhausted, '**' matches everything remaining
            if (pi == pat_segs.size()) return true;
            // Try matching remaining pattern from every remaining path position
            for (size_t k = si; k <= path_segs.size(); k++) {
                if (match_segments(pat_segs, pi, path_segs, k)) return true;
            }
            return false;
        }

        if (!match_tokens(ps.tokens, 0, path_segs[si], 0)) return false;
        pi++;
        si++;
    }

    // Path exhausted. A '**' that follows another segment needs at least one
    // segment of its own ("a/**" is everything inside a, not a itself); only a
    // bare leading '**' may match nothing.
    if (pi > 0 && pi < pat_segs.size() && pat_segs[pi].double_star) return false;
    while (pi < pat_segs.size() && pat_segs[pi].double_star) pi++;

    return pi == pat_segs.size() && si == path_segs.size();
}

// ---- Public API ----

Result<GlobPattern> GlobPattern::compile(const std::string& pattern) {
    std::string body = pattern;

    // Collapse consecutive slashes
    std::string collapsed;
    collapsed.reserve(body.size());
    for (char c : body) {
        if (c == '/' && !collapsed.empty() && collapsed.back() == '/') continue;
        collapsed.push_back(c);
    }
    body = std::move(collapsed);

    if (!body.empty() && body.front() == '/') body.erase(0, 1);

    if (body.empty()) {
        return bad_pattern(pattern, "pattern is empty");
    }

    GlobPattern glob;
    glob.source_ = pattern;
    for (const auto& seg : split_segments(body)) {
        auto compiled = compile_segment(pattern, seg);
        if (compiled.is_err()) return std::move(compiled).error();
        glob.segments_.push_back(std::move(compiled).value());
    }

    return Result<GlobPattern>::ok(std::move(glob));
}

bool GlobPattern::match(const std::string& path) const {
    return match_segments(segments_, 0, split_segments(path), 0);
}

bool glob_is_negation(const std::string& pattern, std::string& inner) {
    if (!pattern.empty() && pattern[0] == '!') {
        inner = pattern.substr(1);
        return true;
    }
    return false;
}

} // namespace pathmatch
