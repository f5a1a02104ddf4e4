#pragma once

#include <map>
#include <string>
#include <vector>

namespace partdb2kicad {

// symbol name -> block text, exactly as found in the file
using SymbolMap = std::map<std::string, std::string>;

struct ParserOptions {
    bool verbose = false;
};

// Whole-block extractor for .kicad_sym files. Not a grammar: it finds each
// top-level `(symbol "NAME"` and walks forward counting parentheses outside
// of quoted strings until the depth returns to zero.
class LibraryParser {
public:
    explicit LibraryParser(const ParserOptions& opts = {});

    // Extract top-level symbol blocks. A block without a closing paren is
    // reported as a warning and left out.
    SymbolMap parse(const std::string& text, const std::string& source = "<memory>");

    // Parse a library file. A missing file yields an empty map and true;
    // a path that exists but is not a readable file returns false.
    bool parse_file(const std::string& filename, SymbolMap& symbols);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    ParserOptions opts_;
    std::vector<std::string> warnings_;

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

// Position of the parenthesis closing the one at `start`, or npos.
// Escaped quotes do not toggle the in-string state.
size_t find_matching_paren(const std::string& text, size_t start);

// True if the quote at `pos` follows an odd run of backslashes.
bool is_escaped_quote(const std::string& text, size_t pos);

// Position of the quote closing the string opened at `open`, or npos.
size_t find_closing_quote(const std::string& text, size_t open);

// Read a whole file. Returns false if it cannot be opened or read.
bool read_file(const std::string& filename, std::string& content);

} // namespace partdb2kicad
