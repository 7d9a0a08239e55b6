#include <catch2/catch.hpp>
#include <pathmatch/config.hpp>
#include <cstdlib>

using namespace pathmatch;

static std::string fixture_dir() {
    const char* src = std::getenv("PATHMATCH_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

// ===== Parsing =====

TEST_CASE("parse full pathmatch section", "[config]") {
    auto r = Config::parse(R"(
[pathmatch]
patterns = "/etc/fields.patterns"
output = "unmatched"
ignore-unused-patterns = true
log-level = "debug"
)");
    REQUIRE(r.is_ok());
    auto& cfg = r.value();
    REQUIRE(cfg.patterns == std::string("/etc/fields.patterns"));
    REQUIRE(cfg.output == OutputMode::Unmatched);
    REQUIRE(cfg.ignore_unused_patterns == true);
    REQUIRE(cfg.log_level == log::Debug);
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().patterns.has_value());
    REQUIRE_FALSE(r.value().output.has_value());
    REQUIRE_FALSE(r.value().ignore_unused_patterns.has_value());
    REQUIRE_FALSE(r.value().log_level.has_value());
}

TEST_CASE("other tables are ignored", "[config]") {
    auto r = Config::parse(R"(
[tap]
name = "tap-postgres"
)");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().output.has_value());
}

TEST_CASE("relative patterns path resolves against base dir", "[config]") {
    auto r = Config::parse(R"(
[pathmatch]
patterns = "fields.patterns"
)", "/srv/etl");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().patterns == std::string("/srv/etl/fields.patterns"));
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PathmatchError::Config);
}

TEST_CASE("unknown output mode is Config error", "[config]") {
    auto r = Config::parse(R"(
[pathmatch]
output = "yaml"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PathmatchError::Config);
    REQUIRE(r.error().message.find("yaml") != std::string::npos);
}

TEST_CASE("unknown log level is Config error", "[config]") {
    auto r = Config::parse(R"(
[pathmatch]
log-level = "loud"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PathmatchError::Config);
}

// ===== Merge =====

TEST_CASE("merge overrides only set values", "[config]") {
    auto base = Config::parse(R"(
[pathmatch]
patterns = "/a.patterns"
output = "matched"
ignore-unused-patterns = true
)").value();

    Config overlay;
    overlay.output = OutputMode::Unmatched;
    overlay.log_level = log::Warn;

    base.merge(overlay);
    REQUIRE(base.patterns == std::string("/a.patterns"));   // preserved
    REQUIRE(base.output == OutputMode::Unmatched);          // overridden
    REQUIRE(base.ignore_unused_patterns == true);           // preserved
    REQUIRE(base.log_level == log::Warn);                   // added
}

TEST_CASE("merge with empty config is a no-op", "[config]") {
    auto base = Config::parse(R"(
[pathmatch]
output = "matched"
)").value();
    base.merge(Config{});
    REQUIRE(base.output == OutputMode::Matched);
}

// ===== Loading =====

TEST_CASE("load fixture config", "[config]") {
    auto r = Config::load(fixture_dir() + "/pathmatch.toml");
    REQUIRE(r.is_ok());
    auto& cfg = r.value();
    REQUIRE(cfg.patterns.has_value());
    REQUIRE(cfg.patterns->find("select.patterns") != std::string::npos);
    REQUIRE(cfg.patterns->find("fixtures") != std::string::npos);
    REQUIRE(cfg.output == OutputMode::Matched);
    REQUIRE(cfg.ignore_unused_patterns == false);
    REQUIRE(cfg.log_level == log::Warn);
}

TEST_CASE("load missing config is IO error", "[config]") {
    auto r = Config::load("/nonexistent_dir_xyz_123/pathmatch.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PathmatchError::IO);
}

TEST_CASE("local config path", "[config]") {
    REQUIRE(local_config_path() == "pathmatch.toml");
}
