#pragma once

#include <string>

namespace partdb2kicad {

// Collapse whitespace runs to single spaces and trim. Only used to compare
// blocks; files are always written with the renderer's own formatting.
std::string normalize_symbol(const std::string& text);

// True when both blocks are equal after normalization
bool symbols_equal(const std::string& a, const std::string& b);

} // namespace partdb2kicad
