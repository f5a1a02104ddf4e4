#pragma once

#include "part_model.h"
#include <istream>
#include <string>
#include <vector>

namespace partdb2kicad {

// Read part records as delivered by the Part-DB fetch collaborator: either a
// JSON array of parts or an API page with a "hydra:member" array.
// Returns true on success, false on parse error.
bool read_parts_json(std::istream& in, std::vector<PartRecord>& parts);

// Convenience: read from a JSON string.
bool read_parts_json(const std::string& json_text, std::vector<PartRecord>& parts);

bool read_parts_file(const std::string& filename, std::vector<PartRecord>& parts);

} // namespace partdb2kicad
