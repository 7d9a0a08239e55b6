#include <pathmatch/field_walker.hpp>

namespace pathmatch {

std::string make_path(const std::string& stream_name, const Breadcrumb& breadcrumb) {
    std::string path = stream_name;
    for (size_t i = 1; i < breadcrumb.size(); ++i) {
        path += '/';
        path += breadcrumb[i];
    }
    return path;
}

std::set<std::string> matchable_inclusions(const Stream& stream) {
    std::set<std::string> inclusions = {"available"};
    if (stream.metadata.inclusion({}) == "available") {
        inclusions.insert("automatic");
    }
    return inclusions;
}

void for_each_field(const Catalog& catalog, const std::function<void(const Field&)>& fn) {
    for (const auto& stream : catalog.streams()) {
        auto inclusions = matchable_inclusions(stream);

        for (const auto& [breadcrumb, props] : stream.metadata.entries()) {
            if (breadcrumb.empty() || breadcrumb[0] != "properties") continue;
            if (inclusions.count(stream.metadata.inclusion(breadcrumb)) == 0) continue;

            fn(Field{stream.name, breadcrumb, make_path(stream.name, breadcrumb)});
        }
    }
}

std::vector<Field> walk_fields(const Catalog& catalog) {
    std::vector<Field> fields;
    for_each_field(catalog, [&](const Field& f) { fields.push_back(f); });
    return fields;
}

} // namespace pathmatch
