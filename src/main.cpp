#include <pathmatch/app.hpp>
#include <pathmatch/config.hpp>
#include <pathmatch/log.hpp>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <optional>
#include <string>

using namespace pathmatch;

namespace {

constexpr const char* program_description =
    "Select fields in a Singer catalog using git-style pattern matching.";

// Settings given on the command line, as a config layer on top of the file
struct CliArgs {
    std::string catalog_path;
    std::string patterns_path;
    std::string output_path;
    std::string config_path;
    bool matched = false;
    bool unmatched = false;
    bool ignore_unused = false;
    bool verbose = false;
    bool quiet = false;
    bool no_color = false;

    Config as_config() const {
        Config cfg;
        if (!patterns_path.empty()) cfg.patterns = patterns_path;
        if (matched) cfg.output = OutputMode::Matched;
        if (unmatched) cfg.output = OutputMode::Unmatched;
        if (ignore_unused) cfg.ignore_unused_patterns = true;
        if (verbose) cfg.log_level = log::Debug;
        if (quiet) cfg.log_level = log::Error;
        return cfg;
    }
};

Result<Config> load_file_config(const CliArgs& args) {
    if (!args.config_path.empty()) {
        return Config::load(args.config_path);
    }

    std::error_code ec;
    auto local = local_config_path();
    if (std::filesystem::is_regular_file(local, ec)) {
        log::debug("using config file %s", local.c_str());
        return Config::load(local);
    }
    return Result<Config>::ok(Config{});
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;

    CLI::App program{program_description, "pathmatch"};
    program.set_version_flag("--version", "0.1.0");

    program.add_option("catalog", args.catalog_path, "read this Singer catalog JSON file")
        ->required()
        ->type_name("CATALOG");
    program.add_option("-p,--patterns", args.patterns_path,
        "select fields matching a git-style patterns file")->type_name("PATH");
    program.add_option("-o,--output", args.output_path,
        "write output to path instead of stdout")->type_name("PATH");
    program.add_option("-c,--config", args.config_path,
        "read settings from this TOML file")->type_name("PATH");

    auto* matched = program.add_flag("-m,--matched", args.matched,
        "instead of catalog, produce list of matched fields");
    auto* unmatched = program.add_flag("-u,--unmatched", args.unmatched,
        "instead of catalog, produce list of unmatched fields");
    matched->excludes(unmatched);

    program.add_flag("--ignore-unused-patterns", args.ignore_unused,
        "suppress requirement that every pattern matches some field(s)");

    auto* verbose = program.add_flag("-v,--verbose", args.verbose, "log progress to stderr");
    auto* quiet = program.add_flag("-q,--quiet", args.quiet, "log errors only");
    verbose->excludes(quiet);
    program.add_flag("--no-color", args.no_color, "do not color log output");

    try {
        program.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return program.exit(e);
    }

    if (args.no_color) log::set_color_enabled(false);
    auto cli_config = args.as_config();
    if (cli_config.log_level) log::set_level(*cli_config.log_level);

    auto file_config = load_file_config(args);
    if (file_config.is_err()) {
        log::error("%s", file_config.error().format().c_str());
        return 1;
    }

    Config effective = std::move(file_config).value();
    effective.merge(cli_config);

    Options opts;
    opts.catalog_path = args.catalog_path;
    if (!args.output_path.empty()) opts.output_path = args.output_path;
    opts.apply(effective);
    log::set_level(opts.log_level);

    auto status = execute(opts);
    if (status.is_err()) {
        log::error("%s", status.error().format().c_str());
        return 1;
    }
    return 0;
}
