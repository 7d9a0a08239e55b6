#pragma once

#include <pathmatch/catalog.hpp>
#include <pathmatch/matcher.hpp>
#include <optional>
#include <ostream>
#include <string>

namespace pathmatch {

enum class OutputMode { Catalog, Matched, Unmatched };

const char* output_mode_name(OutputMode mode);
std::optional<OutputMode> parse_output_mode(const std::string& name);

// One path per line, in walk order
void produce_matched(std::ostream& out, const CatalogMatch& match);
void produce_unmatched(std::ostream& out, const CatalogMatch& match);

// Write selected=true on every matched field. For streams whose own inclusion
// is "available", also write the stream-level selected flag (true iff the
// stream has at least one match). Unmatched fields are left untouched.
void apply_selection(Catalog& catalog, const CatalogMatch& match);

// apply_selection(), then write the annotated document
void produce_catalog(std::ostream& out, Catalog& catalog, const CatalogMatch& match);

void produce(OutputMode mode, std::ostream& out, Catalog& catalog, const CatalogMatch& match);

} // namespace pathmatch
