#include "symbol_diff.h"
#include "utils.h"

namespace partdb2kicad {

std::string normalize_symbol(const std::string& text) {
    return collapse_whitespace(text);
}

bool symbols_equal(const std::string& a, const std::string& b) {
    return normalize_symbol(a) == normalize_symbol(b);
}

} // namespace partdb2kicad
