#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pathmatch {

// Key order of every JSON object is preserved so output is deterministic and
// diffs cleanly against the input catalog.
using Json = nlohmann::ordered_json;

// Path of a node in a stream's metadata tree. Empty for the stream itself,
// {"properties", "a", "properties", "b"} for nested field a.b.
using Breadcrumb = std::vector<std::string>;

// Breadcrumb -> properties mapping for one stream, in insertion order.
//
// Converts to and from the list form used in catalog documents:
//   [{"breadcrumb": [...], "metadata": {...}}, ...]
class MetadataMap {
public:
    using Entry = std::pair<Breadcrumb, Json>;

    // Entries that are not objects or lack a "breadcrumb" array are skipped.
    // A repeated breadcrumb replaces the earlier properties in place.
    static MetadataMap from_list(const Json& list);
    Json to_list() const;

    // True when to_list() reproduces the list given to from_list(): every
    // entry was exactly {"breadcrumb": [...], "metadata": {...}} and no
    // breadcrumb repeated. False for a default-constructed map.
    bool round_trips() const { return round_trips_; }

    // Properties for a breadcrumb, or nullptr if absent
    const Json* get(const Breadcrumb& breadcrumb) const;

    // The "inclusion" property as a string, empty if absent or not a string
    std::string inclusion(const Breadcrumb& breadcrumb) const;

    // Set one property, creating the entry if needed
    void write(const Breadcrumb& breadcrumb, const std::string& key, Json value);

    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
    std::map<Breadcrumb, size_t> index_;
    bool round_trips_ = false;
};

} // namespace pathmatch
