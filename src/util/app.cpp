#include <pathmatch/app.hpp>
#include <pathmatch/catalog.hpp>
#include <pathmatch/matcher.hpp>
#include <pathmatch/pattern.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

namespace pathmatch {

void Options::apply(const Config& cfg) {
    if (cfg.patterns) patterns_path = cfg.patterns;
    if (cfg.output) mode = *cfg.output;
    if (cfg.ignore_unused_patterns) ignore_unused = *cfg.ignore_unused_patterns;
    if (cfg.log_level) log_level = *cfg.log_level;
}

static Result<std::vector<Pattern>> load_patterns(const Options& opts) {
    if (!opts.patterns_path) {
        return compile_patterns(default_pattern_lines());
    }

    auto lines = read_pattern_lines(*opts.patterns_path);
    if (lines.is_err()) return std::move(lines).error();

    auto patterns = compile_patterns(lines.value());
    if (patterns.is_err()) {
        patterns.error().file = *opts.patterns_path;
    }
    return patterns;
}

Status run(const Options& opts, std::ostream& out) {
    auto catalog = Catalog::load(opts.catalog_path);
    if (catalog.is_err()) return std::move(catalog).error();
    log::debug("loaded %zu stream(s) from %s",
               catalog.value().streams().size(), opts.catalog_path.c_str());

    auto patterns = load_patterns(opts);
    if (patterns.is_err()) return std::move(patterns).error();
    log::debug("compiled %zu pattern(s)", patterns.value().size());
    if (patterns.value().empty() && opts.patterns_path) {
        log::warn("no patterns in %s; no field will be selected",
                  opts.patterns_path->c_str());
    }

    auto match = match_catalog(patterns.value(), catalog.value());
    log::debug("%zu field(s) matched, %zu unmatched",
               match.matched.size(), match.unmatched.size());

    PATHMATCH_TRY(check_unused(match, opts.ignore_unused));

    log::info("selected %zu of %zu field(s)", match.matched.size(),
              match.matched.size() + match.unmatched.size());
    log::debug("producing %s output", output_mode_name(opts.mode));
    produce(opts.mode, out, catalog.value(), match);
    if (!out) {
        return PathmatchError{PathmatchError::IO, "failed to write output"};
    }
    return ok_status();
}

Status execute(const Options& opts) {
    if (!opts.output_path) {
        return run(opts, std::cout);
    }

    // Buffer so a failed run leaves no partial output file behind
    std::ostringstream buffer;
    PATHMATCH_TRY(run(opts, buffer));

    std::ofstream file(*opts.output_path);
    if (!file.is_open()) {
        return PathmatchError{PathmatchError::IO,
            "cannot open output file: " + *opts.output_path};
    }
    file << buffer.str();
    if (!file) {
        return PathmatchError{PathmatchError::IO,
            "error writing output file: " + *opts.output_path};
    }
    return ok_status();
}

} // namespace pathmatch
