#include <pathmatch/producer.hpp>
#include <unordered_map>

namespace pathmatch {

const char* output_mode_name(OutputMode mode) {
    switch (mode) {
        case OutputMode::Catalog:   return "catalog";
        case OutputMode::Matched:   return "matched";
        case OutputMode::Unmatched: return "unmatched";
    }
    return "unknown";
}

std::optional<OutputMode> parse_output_mode(const std::string& name) {
    for (auto mode : {OutputMode::Catalog, OutputMode::Matched, OutputMode::Unmatched}) {
        if (name == output_mode_name(mode)) return mode;
    }
    return std::nullopt;
}

static void write_paths(std::ostream& out, const std::vector<Field>& fields) {
    for (const auto& f : fields) {
        out << f.path << '\n';
    }
}

void produce_matched(std::ostream& out, const CatalogMatch& match) {
    write_paths(out, match.matched);
}

void produce_unmatched(std::ostream& out, const CatalogMatch& match) {
    write_paths(out, match.unmatched);
}

void apply_selection(Catalog& catalog, const CatalogMatch& match) {
    std::unordered_map<std::string, std::vector<const Field*>> by_stream;
    for (const auto& f : match.matched) {
        by_stream[f.stream_name].push_back(&f);
    }

    for (auto& stream : catalog.streams()) {
        const auto& fields = by_stream[stream.name];

        for (const Field* f : fields) {
            stream.metadata.write(f->breadcrumb, "selected", true);
        }

        if (stream.metadata.inclusion({}) == "available") {
            stream.metadata.write({}, "selected", !fields.empty());
        }
    }

    catalog.sync();
}

void produce_catalog(std::ostream& out, Catalog& catalog, const CatalogMatch& match) {
    apply_selection(catalog, match);
    out << catalog.dump();
}

void produce(OutputMode mode, std::ostream& out, Catalog& catalog, const CatalogMatch& match) {
    switch (mode) {
    case OutputMode::Catalog:
        produce_catalog(out, catalog, match);
        break;
    case OutputMode::Matched:
        produce_matched(out, match);
        break;
    case OutputMode::Unmatched:
        produce_unmatched(out, match);
        break;
    }
}

} // namespace pathmatch
