#pragma once

#include <pathmatch/config.hpp>
#include <pathmatch/log.hpp>
#include <pathmatch/producer.hpp>
#include <pathmatch/result.hpp>
#include <optional>
#include <ostream>
#include <string>

namespace pathmatch {

struct Options {
    std::string catalog_path;
    std::optional<std::string> patterns_path;  // default: select everything
    std::optional<std::string> output_path;    // default: stdout
    OutputMode mode = OutputMode::Catalog;
    bool ignore_unused = false;
    log::Level log_level = log::Warn;

    // Fill the optional settings from a merged config
    void apply(const Config& cfg);
};

// Load, compile, match, check for unused patterns, then write to `out`.
// Nothing is written unless every earlier step succeeded.
Status run(const Options& opts, std::ostream& out);

// run() against opts.output_path, or stdout when unset
Status execute(const Options& opts);

} // namespace pathmatch
