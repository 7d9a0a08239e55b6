#include <pathmatch/catalog.hpp>
#include <pathmatch/log.hpp>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace pathmatch {

Result<Catalog> Catalog::parse(const std::string& json_text) {
    Catalog cat;
    try {
        cat.document_ = Json::parse(json_text);
    } catch (const Json::parse_error& e) {
        return PathmatchError{PathmatchError::Parse,
            std::string("catalog JSON parse error: ") + e.what()};
    }

    if (!cat.document_.is_object()) {
        return PathmatchError{PathmatchError::Parse,
            "catalog must be a JSON object",
            "expected a document of the form {\"streams\": [...]}"};
    }

    auto streams_it = cat.document_.find("streams");
    if (streams_it == cat.document_.end() || !streams_it->is_array()) {
        return Result<Catalog>::ok(std::move(cat));
    }

    std::unordered_set<std::string> seen;
    size_t position = 0;
    for (const auto& entry : *streams_it) {
        if (!entry.is_object()) {
            return PathmatchError{PathmatchError::Parse,
                "stream #" + std::to_string(position) + " is not a JSON object"};
        }

        auto name_it = entry.find("stream");
        if (name_it == entry.end() || !name_it->is_string()) {
            return PathmatchError{PathmatchError::Parse,
                "stream #" + std::to_string(position) + " has no \"stream\" name"};
        }

        Stream s;
        s.name = name_it->get<std::string>();
        if (!seen.insert(s.name).second) {
            return PathmatchError{PathmatchError::Duplicate,
                "duplicate stream name in catalog: " + s.name};
        }

        auto md_it = entry.find("metadata");
        if (md_it != entry.end()) {
            s.metadata = MetadataMap::from_list(*md_it);
        }

        cat.streams_.push_back(std::move(s));
        ++position;
    }

    return Result<Catalog>::ok(std::move(cat));
}

Result<Catalog> Catalog::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PathmatchError{PathmatchError::IO,
            "cannot open catalog file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto res = Catalog::parse(ss.str());
    if (res.is_err()) {
        res.error().file = path;
    }
    return res;
}

const Stream* Catalog::find_stream(const std::string& name) const {
    for (const auto& s : streams_) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

void Catalog::sync() {
    auto streams_it = document_.find("streams");
    if (streams_it == document_.end() || !streams_it->is_array()) return;

    // parse() accepted every entry, so positions line up with streams_
    for (size_t i = 0; i < streams_.size(); ++i) {
        auto& entry = (*streams_it)[i];
        if (streams_[i].metadata.round_trips()) {
            entry["metadata"] = streams_[i].metadata.to_list();
        } else if (entry.contains("metadata")) {
            log::warn("stream %s: metadata is not a well-formed list, left unchanged",
                      streams_[i].name.c_str());
        }
    }
}

std::string Catalog::dump() const {
    return document_.dump(2, ' ', true) + "\n";
}

} // namespace pathmatch
