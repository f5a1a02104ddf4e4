#include "library_parser.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <regex>

#include "utils.h"

namespace partdb2kicad {

bool is_escaped_quote(const std::string& text, size_t pos) {
    size_t backslashes = 0;
    while (pos > backslashes && text[pos - backslashes - 1] == '\\') {
        backslashes++;
    }
    return backslashes % 2 == 1;
}

size_t find_closing_quote(const std::string& text, size_t open) {
    for (size_t i = open + 1; i < text.size(); i++) {
        if (text[i] == '"' && !is_escaped_quote(text, i)) return i;
    }
    return std::string::npos;
}

size_t find_matching_paren(const std::string& text, size_t start) {
    int depth = 0;
    bool in_string = false;
    for (size_t i = start; i < text.size(); i++) {
        char c = text[i];
        if (c == '"' && !is_escaped_quote(text, i)) {
            in_string = !in_string;
        } else if (c == '(' && !in_string) {
            depth++;
        } else if (c == ')' && !in_string) {
            depth--;
            if (depth == 0) return i;
        }
    }
    return std::string::npos;
}

bool read_file(const std::string& filename, std::string& content) {
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) return false;
    content.assign((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
    return !in.bad();
}

LibraryParser::LibraryParser(const ParserOptions& opts)
    : opts_(opts) {}

SymbolMap LibraryParser::parse(const std::string& text, const std::string& source) {
    static const std::regex re_symbol(R"re(\(\s*symbol\s+")re");

    SymbolMap symbols;
    size_t covered_until = 0;  // end of the last extracted block

    auto begin = std::sregex_iterator(text.begin(), text.end(), re_symbol);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        size_t start = static_cast<size_t>(it->position(0));
        // Child units ("NAME_1_1") live inside their parent's block
        if (start < covered_until) continue;

        size_t open = start + static_cast<size_t>(it->length(0)) - 1;
        size_t name_end = find_closing_quote(text, open);
        if (name_end == std::string::npos) {
            warn("Unterminated symbol name in " + source + ", skipping");
            continue;
        }
        std::string name = sexp_unescape(text.substr(open + 1, name_end - open - 1));
        size_t close = find_matching_paren(text, start);
        if (close == std::string::npos) {
            warn("Could not parse symbol '" + name + "' in " + source + ", skipping");
            continue;
        }

        if (symbols.count(name)) {
            warn("Symbol '" + name + "' appears more than once in " + source +
                 ", keeping the last definition");
        }
        symbols[name] = text.substr(start, close - start + 1);
        covered_until = close + 1;
    }

    log("Found " + std::to_string(symbols.size()) + " existing symbols in " + source);
    return symbols;
}

bool LibraryParser::parse_file(const std::string& filename, SymbolMap& symbols) {
    symbols.clear();
    std::error_code ec;
    if (!std::filesystem::exists(filename, ec)) {
        log("No existing library at " + filename);
        return true;
    }

    std::string content;
    if (!std::filesystem::is_regular_file(filename, ec) || !read_file(filename, content)) {
        warn("Cannot read existing library " + filename);
        return false;
    }
    symbols = parse(content, filename);
    return true;
}

// --- Logging ---

void LibraryParser::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cout << "[parser] " << msg << std::endl;
    }
}

void LibraryParser::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace partdb2kicad
