#pragma once

#include <pathmatch/catalog.hpp>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace pathmatch {

// A selectable field, identified by its stream and breadcrumb, with the
// canonical path patterns are matched against.
struct Field {
    std::string stream_name;
    Breadcrumb breadcrumb;
    std::string path;
};

// stream_name joined by '/' with every breadcrumb segment after the first:
//   ("properties", "a", "properties", "b") on "orders" -> "orders/a/properties/b"
std::string make_path(const std::string& stream_name, const Breadcrumb& breadcrumb);

// Inclusion values whose fields may be matched in this stream. Automatic
// fields become matchable when the stream itself is optional ("available"),
// since selecting any field is what selects the stream.
std::set<std::string> matchable_inclusions(const Stream& stream);

// Visit every selectable field in stream order, then metadata order.
void for_each_field(const Catalog& catalog, const std::function<void(const Field&)>& fn);

std::vector<Field> walk_fields(const Catalog& catalog);

} // namespace pathmatch
