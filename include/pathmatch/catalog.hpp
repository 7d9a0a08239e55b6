#pragma once

#include <pathmatch/metadata.hpp>
#include <pathmatch/result.hpp>
#include <string>
#include <vector>

namespace pathmatch {

struct Stream {
    std::string name;
    MetadataMap metadata;
};

// A loaded catalog document plus a per-stream view of its metadata.
//
// The JSON document is kept whole so that everything this tool does not
// touch (schemas, tap-specific keys) is written back unchanged.
class Catalog {
public:
    static Result<Catalog> parse(const std::string& json_text);
    static Result<Catalog> load(const std::string& path);

    std::vector<Stream>& streams() { return streams_; }
    const std::vector<Stream>& streams() const { return streams_; }

    // Stream by name, or nullptr
    const Stream* find_stream(const std::string& name) const;

    // Copy each stream's metadata map back into the document. A stream whose
    // metadata would not survive the copy (see MetadataMap::round_trips) is
    // left as it was, with a warning; one without metadata gets none.
    void sync();

    // Serialized document: 2-space indent, ASCII-escaped, trailing newline
    std::string dump() const;

    const Json& document() const { return document_; }

private:
    Json document_;
    std::vector<Stream> streams_;
};

} // namespace pathmatch
