#include <pathmatch/matcher.hpp>
#include <pathmatch/log.hpp>
#include <algorithm>

namespace pathmatch {

MatchOutcome match_path(const std::vector<Pattern>& patterns, const std::string& path) {
    MatchOutcome outcome;

    for (const auto& pattern : patterns) {
        if (pattern.negation == outcome.selected && pattern.compiled.match(path)) {
            outcome.matching = &pattern;
            outcome.selected = !outcome.selected;
        }
    }

    return outcome;
}

CatalogMatch match_catalog(const std::vector<Pattern>& patterns, const Catalog& catalog) {
    CatalogMatch result;
    std::vector<bool> used(patterns.size(), false);

    for_each_field(catalog, [&](const Field& field) {
        auto outcome = match_path(patterns, field.path);
        log::trace("%s -> %s", field.path.c_str(),
                   outcome.selected ? "selected" : "not selected");

        if (outcome.selected) {
            result.matched.push_back(field);
        } else {
            result.unmatched.push_back(field);
        }

        if (outcome.matching) {
            used[outcome.matching->index] = true;
        }
    });

    for (const auto& pattern : patterns) {
        if (!used[pattern.index]) {
            result.unused.push_back(&pattern);
        }
    }

    return result;
}

std::vector<std::string> unused_pattern_strings(const CatalogMatch& match) {
    std::vector<std::string> strings;
    strings.reserve(match.unused.size());
    for (const Pattern* p : match.unused) {
        strings.push_back(p->text);
    }
    std::sort(strings.begin(), strings.end());
    return strings;
}

Status check_unused(const CatalogMatch& match, bool ignore_unused) {
    if (match.unused.empty()) return ok_status();

    auto strings = unused_pattern_strings(match);
    if (ignore_unused) {
        for (const auto& s : strings) {
            log::debug("ignoring unused pattern: %s", s.c_str());
        }
        return ok_status();
    }

    PathmatchError err{PathmatchError::UnusedPatterns,
        "some pattern(s) matched no fields",
        "fix or remove these patterns, or pass --ignore-unused-patterns"};
    err.details = std::move(strings);
    return err;
}

} // namespace pathmatch
