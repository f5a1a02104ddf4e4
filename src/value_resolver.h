#pragma once

#include "part_model.h"
#include <optional>
#include <string>

namespace partdb2kicad {

// Look up a named value on a part record.
//
// Plain path: fixed attribute, then the parameter bag verbatim, then the
// bag with the first letter capitalized.
// Dotted path ("footprint.name"): the first hop is an attribute or bag entry,
// each later hop walks into the attribute tree.
//
// Anything that does not resolve yields an empty string.
std::string resolve(const PartRecord& part, const std::string& path);

// Fixed attribute lookup only (no parameter bag). Null attributes count as
// absent.
std::optional<nlohmann::ordered_json> find_attribute(const PartRecord& part,
                                                     const std::string& key);

// Render a resolved JSON value as text; null becomes "".
std::string value_text(const nlohmann::ordered_json& value);

// Strip the quotes from a quoted literal ('R?' -> R?). Returns false if the
// text is not a quoted literal.
bool unquote_literal(const std::string& text, std::string& out);

} // namespace partdb2kicad
