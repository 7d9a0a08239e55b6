#include <catch2/catch.hpp>
#include <pathmatch/catalog.hpp>
#include <cstdlib>

using namespace pathmatch;

static std::string fixture_dir() {
    const char* src = std::getenv("PATHMATCH_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

TEST_CASE("load fixture catalog", "[catalog]") {
    auto r = Catalog::load(fixture_dir() + "/catalog.json");
    REQUIRE(r.is_ok());
    auto& cat = r.value();
    REQUIRE(cat.streams().size() == 3);
    REQUIRE(cat.streams()[0].name == "orders");
    REQUIRE(cat.streams()[1].name == "customers");
    REQUIRE(cat.streams()[2].name == "audit_log");
    REQUIRE(cat.streams()[0].metadata.size() == 7);

    const Stream* customers = cat.find_stream("customers");
    REQUIRE(customers != nullptr);
    REQUIRE(customers->metadata.inclusion({}) == "automatic");
    REQUIRE(cat.find_stream("nope") == nullptr);
}

TEST_CASE("load missing catalog is IO error", "[catalog]") {
    auto r = Catalog::load("/nonexistent_dir_xyz_123/catalog.json");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PathmatchError::IO);
}

TEST_CASE("unparseable catalog is Parse error", "[catalog]") {
    auto r = Catalog::parse("{\"streams\": [");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PathmatchError::Parse);
}

TEST_CASE("non-object catalog is Parse error", "[catalog]") {
    auto r = Catalog::parse("[1, 2, 3]");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PathmatchError::Parse);
}

TEST_CASE("missing or odd streams key means empty catalog", "[catalog]") {
    REQUIRE(Catalog::parse("{}").value().streams().empty());
    REQUIRE(Catalog::parse(R"({"streams": {}})").value().streams().empty());
}

TEST_CASE("stream without metadata has no entries", "[catalog]") {
    auto r = Catalog::parse(R"({"streams": [{"stream": "a"}, {"stream": "b", "metadata": 7}]})");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().streams().size() == 2);
    REQUIRE(r.value().streams()[0].metadata.empty());
    REQUIRE(r.value().streams()[1].metadata.empty());
}

TEST_CASE("stream without a name is Parse error", "[catalog]") {
    auto r = Catalog::parse(R"({"streams": [{"tap_stream_id": "a", "metadata": []}]})");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PathmatchError::Parse);
}

TEST_CASE("duplicate stream names are rejected", "[catalog]") {
    auto r = Catalog::parse(R"({"streams": [{"stream": "a"}, {"stream": "a"}]})");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PathmatchError::Duplicate);
    REQUIRE(r.error().message.find("a") != std::string::npos);
}

TEST_CASE("dump preserves key order and untouched content", "[catalog]") {
    auto r = Catalog::parse(R"({"version": 2, "streams": [{"stream": "s", "schema": {"z": 1, "a": 2},
        "metadata": [{"breadcrumb": [], "metadata": {"inclusion": "available"}}]}]})");
    REQUIRE(r.is_ok());
    auto out = r.value().dump();

    REQUIRE(out.back() == '\n');
    REQUIRE(out.find("\"version\"") < out.find("\"streams\""));
    REQUIRE(out.find("\"z\"") < out.find("\"a\""));
    REQUIRE(Json::parse(out) == r.value().document());
}

TEST_CASE("dump escapes non-ASCII", "[catalog]") {
    auto r = Catalog::parse(R"({"streams": [{"stream": "café"}]})");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().streams()[0].name == "caf\xc3\xa9");
    REQUIRE(r.value().dump().find("\\u00e9") != std::string::npos);
}

TEST_CASE("sync writes metadata back into the document", "[catalog]") {
    auto r = Catalog::parse(R"({"streams": [{"stream": "s",
        "metadata": [{"breadcrumb": ["properties", "x"], "metadata": {"inclusion": "available"}}]}]})");
    REQUIRE(r.is_ok());
    auto& cat = r.value();
    cat.streams()[0].metadata.write({"properties", "x"}, "selected", true);
    cat.sync();

    const auto& md = cat.document()["streams"][0]["metadata"];
    REQUIRE(md.size() == 1);
    REQUIRE(md[0]["metadata"]["selected"] == true);
    REQUIRE(md[0]["metadata"]["inclusion"] == "available");
}

TEST_CASE("sync leaves malformed metadata lists untouched", "[catalog]") {
    auto r = Catalog::parse(R"({"streams": [
        {"stream": "bad", "metadata": [
            {"breadcrumb": ["properties", "x"], "metadata": {"inclusion": "available"}},
            {"breadcrumb": "properties/y", "metadata": {"inclusion": "available"}}
        ]},
        {"stream": "odd", "metadata": 7},
        {"stream": "bare"},
        {"stream": "good", "metadata": [
            {"breadcrumb": ["properties", "z"], "metadata": {"inclusion": "available"}}
        ]}
    ]})");
    REQUIRE(r.is_ok());
    auto& cat = r.value();
    Json before = cat.document();

    for (auto& s : cat.streams()) {
        s.metadata.write({"properties", "x"}, "selected", true);
        s.metadata.write({"properties", "z"}, "selected", true);
    }
    cat.sync();

    const auto& streams = cat.document()["streams"];
    REQUIRE(streams[0] == before["streams"][0]);
    REQUIRE(streams[0]["metadata"][1]["breadcrumb"] == "properties/y");
    REQUIRE(streams[1]["metadata"] == 7);
    REQUIRE_FALSE(streams[2].contains("metadata"));
    REQUIRE(streams[3]["metadata"].size() == 2);
    REQUIRE(streams[3]["metadata"][0]["metadata"]["selected"] == true);
}
