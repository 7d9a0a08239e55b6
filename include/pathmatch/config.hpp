#pragma once

#include <pathmatch/log.hpp>
#include <pathmatch/producer.hpp>
#include <pathmatch/result.hpp>
#include <optional>
#include <string>

namespace pathmatch {

// Layered run settings: config file < command line.
// Every field is optional so a layer only overrides what it sets.
//
//   [pathmatch]
//   patterns = "fields.patterns"
//   output = "catalog"            # or "matched", "unmatched"
//   ignore-unused-patterns = false
//   log-level = "info"
struct Config {
    std::optional<std::string> patterns;
    std::optional<OutputMode> output;
    std::optional<bool> ignore_unused_patterns;
    std::optional<log::Level> log_level;

    // Load from a TOML config file. A relative `patterns` path is resolved
    // against the file's directory.
    static Result<Config> load(const std::string& path);

    // Parse from TOML string; relative `patterns` paths are joined to base_dir
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& base_dir = "");

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);
};

// Config file picked up from the working directory when --config is not given
std::string local_config_path();

} // namespace pathmatch
