#include <pathmatch/pattern.hpp>
#include <fstream>

namespace pathmatch {

static std::string strip(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::vector<std::string> default_pattern_lines() {
    return {"**"};
}

Result<std::vector<Pattern>> compile_patterns(const std::vector<std::string>& lines) {
    std::vector<Pattern> patterns;

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string text = strip(lines[i]);
        if (text.empty() || text[0] == '#') continue;

        std::string body = text;
        bool negation = glob_is_negation(text, body);

        auto compiled = GlobPattern::compile(body);
        if (compiled.is_err()) {
            auto err = std::move(compiled).error();
            err.line = static_cast<int>(i + 1);
            err.hint = "check the wildcard syntax of this pattern";
            return err;
        }

        Pattern p;
        p.text = std::move(text);
        p.negation = negation;
        p.compiled = std::move(compiled).value();
        p.index = patterns.size();
        patterns.push_back(std::move(p));
    }

    return Result<std::vector<Pattern>>::ok(std::move(patterns));
}

Result<std::vector<std::string>> read_pattern_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PathmatchError{PathmatchError::IO,
            "cannot open patterns file: " + path};
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    if (file.bad()) {
        return PathmatchError{PathmatchError::IO,
            "error reading patterns file: " + path};
    }
    return Result<std::vector<std::string>>::ok(std::move(lines));
}

} // namespace pathmatch
