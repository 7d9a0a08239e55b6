#pragma once

#include <pathmatch/catalog.hpp>
#include <pathmatch/field_walker.hpp>
#include <pathmatch/pattern.hpp>
#include <pathmatch/result.hpp>
#include <string>
#include <vector>

namespace pathmatch {

struct MatchOutcome {
    const Pattern* matching = nullptr;  // last pattern that flipped the state
    bool selected = false;
};

// Apply patterns to one path.
//
// The state starts unselected. A pattern takes effect only when it matches
// the path AND its negation flag equals the current state: a positive pattern
// can only select, a '!' pattern can only deselect. Each effective pattern
// flips the state and becomes `matching`.
//
// NOTE: this is stricter than gitignore's "last matching line wins". With
// ["a/*", "a/*"] the second line never takes effect, and with
// ["a/*", "!a/x", "a/*"] the third line is the one credited for "a/x".
// Existing pattern files depend on this, so it is kept as is.
MatchOutcome match_path(const std::vector<Pattern>& patterns, const std::string& path);

struct CatalogMatch {
    std::vector<Field> matched;
    std::vector<Field> unmatched;
    std::vector<const Pattern*> unused;  // in pattern order
};

// Partition every selectable field of the catalog. `unused` holds the
// patterns that were never the matching pattern for any field. Patterns are
// told apart by Pattern::index, so `patterns` must be a list produced by
// compile_patterns(). The returned pointers refer into `patterns`, which must
// outlive the result.
CatalogMatch match_catalog(const std::vector<Pattern>& patterns, const Catalog& catalog);

// Unused pattern strings, sorted
std::vector<std::string> unused_pattern_strings(const CatalogMatch& match);

// Fails with UnusedPatterns unless every pattern was used or ignore_unused is set.
Status check_unused(const CatalogMatch& match, bool ignore_unused);

} // namespace pathmatch
