#include <pathmatch/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace pathmatch {

Result<Config> Config::parse(const std::string& toml_str, const std::string& base_dir) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PathmatchError{PathmatchError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    auto section = doc["pathmatch"].as_table();
    if (!section) {
        return Result<Config>::ok(std::move(cfg));
    }

    if (auto v = (*section)["patterns"].value<std::string>()) {
        std::filesystem::path p(*v);
        if (p.is_relative() && !base_dir.empty()) {
            p = std::filesystem::path(base_dir) / p;
        }
        cfg.patterns = p.string();
    }

    if (auto v = (*section)["output"].value<std::string>()) {
        auto mode = parse_output_mode(*v);
        if (!mode) {
            return PathmatchError{PathmatchError::Config,
                "unknown output mode in config: " + *v,
                "expected one of: catalog, matched, unmatched"};
        }
        cfg.output = *mode;
    }

    if (auto v = (*section)["ignore-unused-patterns"].value<bool>()) {
        cfg.ignore_unused_patterns = *v;
    }

    if (auto v = (*section)["log-level"].value<std::string>()) {
        auto lvl = log::parse_level(*v);
        if (!lvl) {
            return PathmatchError{PathmatchError::Config,
                "unknown log level in config: " + *v,
                "expected one of: trace, debug, info, warn, error"};
        }
        cfg.log_level = *lvl;
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PathmatchError{PathmatchError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto base_dir = std::filesystem::path(path).parent_path().string();
    auto res = Config::parse(ss.str(), base_dir);
    if (res.is_err()) {
        res.error().file = path;
    }
    return res;
}

void Config::merge(const Config& other) {
    if (other.patterns) patterns = other.patterns;
    if (other.output) output = other.output;
    if (other.ignore_unused_patterns) ignore_unused_patterns = other.ignore_unused_patterns;
    if (other.log_level) log_level = other.log_level;
}

std::string local_config_path() {
    return "pathmatch.toml";
}

} // namespace pathmatch
