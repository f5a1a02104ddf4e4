#include "template_extractor.h"
#include "library_parser.h"
#include "utils.h"

#include <nlohmann/json.hpp>
#include <iostream>
#include <regex>
#include <sstream>

using json = nlohmann::ordered_json;

namespace partdb2kicad {

static const char* SYMBOL_OPTIONS[] = {"pin_numbers", "pin_names", "exclude_from_sim"};

TemplateExtractor::TemplateExtractor(const ExtractorOptions& opts)
    : opts_(opts) {}

bool TemplateExtractor::extract(const std::string& library_text, const std::string& symbol_name,
                                SymbolTemplate& tmpl) {
    LibraryParser parser(ParserOptions{opts_.verbose});
    SymbolMap symbols = parser.parse(library_text);
    for (auto& w : parser.warnings()) warnings_.push_back(w);

    auto it = symbols.find(symbol_name);
    if (it == symbols.end()) {
        warn("Symbol '" + symbol_name + "' not found (names are case-sensitive)");
        return false;
    }
    const std::string& block = it->second;

    tmpl = SymbolTemplate();
    tmpl.name = symbol_name;
    tmpl.symbol_options = extract_options(block);
    tmpl.symbol_template = extract_body(block, symbol_name);
    std::string reference;
    extract_properties(block, tmpl, reference);
    tmpl.generator = trim(tmpl.symbol_template).empty() ? GeneratorKind::NONE
                                                        : GeneratorKind::STATIC;

    // Seed the mapping the way most libraries are wired up
    if (reference.empty()) reference = "U";
    tmpl.field_mapping = {
        {"Reference", reference, true},
        {"Value", "value", false},
        {"Footprint", "footprint.name", false},
        {"Datasheet", "manufacturer_product_url", false},
    };

    log("Extracted '" + symbol_name + "': " +
        std::to_string(tmpl.property_templates.size()) + " property templates");
    return true;
}

bool TemplateExtractor::extract_file(const std::string& library_path,
                                     const std::string& symbol_name, SymbolTemplate& tmpl) {
    std::string content;
    if (!read_file(library_path, content)) {
        warn("Library file not found: " + library_path);
        return false;
    }
    return extract(content, symbol_name, tmpl);
}

// ── pieces ──────────────────────────────────────────────────────────

std::string TemplateExtractor::extract_options(const std::string& block) {
    std::string options;
    for (const char* name : SYMBOL_OPTIONS) {
        std::regex re(std::string(R"(\(\s*)") + name + R"(\s+)");
        std::smatch m;
        if (!std::regex_search(block, m, re)) continue;

        size_t start = static_cast<size_t>(m.position(0));
        size_t close = find_matching_paren(block, start);
        if (close == std::string::npos) {
            warn(std::string("Unterminated (") + name + " ...) option, skipped");
            continue;
        }
        if (!options.empty()) options += " ";
        options += collapse_whitespace(block.substr(start, close - start + 1));
    }
    return options;
}

// Top-level pins and the "NAME_u_s" child units, each re-indented so the
// first line stays as found and the rest sit two spaces in.
std::string TemplateExtractor::extract_body(const std::string& block,
                                            const std::string& symbol_name) {
    static const std::regex re_item(R"re(\(\s*(pin|symbol)\s+)re");
    const std::string unit_prefix = "\"" + sexp_escape(symbol_name) + "_";

    std::vector<std::string> parts;
    size_t covered_until = 1;  // skip the enclosing (symbol "NAME" itself
    auto begin = std::sregex_iterator(block.begin(), block.end(), re_item);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        size_t start = static_cast<size_t>(it->position(0));
        if (start < covered_until) continue;

        size_t close = find_matching_paren(block, start);
        if (close == std::string::npos) {
            warn("Unterminated (" + (*it)[1].str() + " ...) in '" + symbol_name + "', skipped");
            continue;
        }
        std::string item = trim(block.substr(start, close - start + 1));

        std::string first_line = item.substr(0, item.find('\n'));
        if ((*it)[1].str() == "symbol" && first_line.find(unit_prefix) == std::string::npos) {
            continue;
        }

        std::istringstream lines(item);
        std::string line, cleaned;
        std::getline(lines, line);
        cleaned = line;
        while (std::getline(lines, line)) {
            cleaned += "\n  " + trim(line);
        }
        parts.push_back(cleaned);
        covered_until = close + 1;
    }

    std::string body;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) body += "\n";
        body += parts[i];
    }
    return body;
}

void TemplateExtractor::extract_properties(const std::string& block, SymbolTemplate& tmpl,
                                           std::string& reference) {
    static const std::regex re_prop(R"re(\(\s*property\s+")re");

    auto begin = std::sregex_iterator(block.begin(), block.end(), re_prop);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        size_t start = static_cast<size_t>(it->position(0));
        size_t close = find_matching_paren(block, start);
        if (close == std::string::npos) continue;

        std::string prop = block.substr(start, close - start + 1);
        size_t name_start = static_cast<size_t>(it->length(0)) - 1;
        size_t name_end = find_closing_quote(prop, name_start);
        if (name_end == std::string::npos) continue;
        std::string name = sexp_unescape(prop.substr(name_start + 1, name_end - name_start - 1));

        // The value is the second quoted string
        size_t value_start = prop.find('"', name_end + 1);
        if (value_start == std::string::npos) {
            warn("Property '" + name + "' has no value, skipped");
            continue;
        }
        size_t value_end = find_closing_quote(prop, value_start);
        if (value_end == std::string::npos) {
            warn("Property '" + name + "' has an unterminated value, skipped");
            continue;
        }

        if (name == "Reference") {
            reference = sexp_unescape(prop.substr(value_start + 1, value_end - value_start - 1));
        }
        std::string pattern = prop.substr(0, value_start + 1) + "{VALUE}" + prop.substr(value_end);
        tmpl.property_templates[name] = collapse_whitespace(pattern);
    }
}

// --- Logging ---

void TemplateExtractor::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cout << "[extract] " << msg << std::endl;
    }
}

void TemplateExtractor::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

// ── output ──────────────────────────────────────────────────────────

void write_template_json(std::ostream& out, const SymbolTemplate& tmpl,
                         const std::string& category) {
    json t;
    t["applies_to_categories"] = json::array({category.empty() ? tmpl.name + "_Category"
                                                                : category});

    json mapping = json::object();
    for (auto& fm : tmpl.field_mapping) {
        mapping[fm.property] = fm.literal ? "'" + fm.source + "'" : fm.source;
    }
    t["field_mapping"] = mapping;

    if (!tmpl.symbol_options.empty()) t["symbol_options"] = tmpl.symbol_options;

    if (!tmpl.property_templates.empty()) {
        json props = json::object();
        for (auto& [name, pattern] : tmpl.property_templates) props[name] = pattern;
        t["property_templates"] = props;
    }

    t["symbol_template"] = tmpl.symbol_template;

    json root;
    root[tmpl.name] = t;
    out << root.dump(2) << "\n";
}

} // namespace partdb2kicad
