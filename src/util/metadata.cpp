#include <pathmatch/metadata.hpp>

namespace pathmatch {

MetadataMap MetadataMap::from_list(const Json& list) {
    MetadataMap map;
    if (!list.is_array()) return map;
    map.round_trips_ = true;

    for (const auto& item : list) {
        if (!item.is_object()) {
            map.round_trips_ = false;
            continue;
        }

        auto bc_it = item.find("breadcrumb");
        if (bc_it == item.end() || !bc_it->is_array()) {
            map.round_trips_ = false;
            continue;
        }

        Breadcrumb breadcrumb;
        bool valid = true;
        for (const auto& seg : *bc_it) {
            if (!seg.is_string()) {
                valid = false;
                break;
            }
            breadcrumb.push_back(seg.get<std::string>());
        }
        if (!valid) {
            map.round_trips_ = false;
            continue;
        }

        Json props = Json::object();
        auto md_it = item.find("metadata");
        if (md_it != item.end() && md_it->is_object()) {
            props = *md_it;
        } else {
            map.round_trips_ = false;
        }
        // Keys other than breadcrumb and metadata are not kept
        if (item.size() != 2) map.round_trips_ = false;

        auto found = map.index_.find(breadcrumb);
        if (found != map.index_.end()) {
            map.entries_[found->second].second = std::move(props);
            map.round_trips_ = false;
        } else {
            map.index_.emplace(breadcrumb, map.entries_.size());
            map.entries_.emplace_back(std::move(breadcrumb), std::move(props));
        }
    }

    return map;
}

Json MetadataMap::to_list() const {
    Json list = Json::array();
    for (const auto& [breadcrumb, props] : entries_) {
        Json item = Json::object();
        item["breadcrumb"] = breadcrumb;
        item["metadata"] = props;
        list.push_back(std::move(item));
    }
    return list;
}

const Json* MetadataMap::get(const Breadcrumb& breadcrumb) const {
    auto it = index_.find(breadcrumb);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

std::string MetadataMap::inclusion(const Breadcrumb& breadcrumb) const {
    const Json* props = get(breadcrumb);
    if (!props) return "";
    auto it = props->find("inclusion");
    if (it == props->end() || !it->is_string()) return "";
    return it->get<std::string>();
}

void MetadataMap::write(const Breadcrumb& breadcrumb, const std::string& key, Json value) {
    auto it = index_.find(breadcrumb);
    if (it != index_.end()) {
        entries_[it->second].second[key] = std::move(value);
        return;
    }

    Json props = Json::object();
    props[key] = std::move(value);
    index_.emplace(breadcrumb, entries_.size());
    entries_.emplace_back(breadcrumb, std::move(props));
}

} // namespace pathmatch
