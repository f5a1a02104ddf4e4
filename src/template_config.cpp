#include "template_config.h"
#include "value_resolver.h"
#include "utils.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::ordered_json;

namespace partdb2kicad {

const SymbolTemplate* TemplateSet::match(const std::string& category_path) const {
    for (auto& tmpl : templates_) {
        for (auto& cat : tmpl.applies_to_categories) {
            if (iends_with(category_path, cat)) return &tmpl;
        }
    }
    return nullptr;
}

GeneratorKind parse_generator_kind(const std::string& s) {
    if (s == "IC_Box")    return GeneratorKind::IC_BOX;
    if (s == "Connector") return GeneratorKind::CONNECTOR;
    if (s == "Static")    return GeneratorKind::STATIC;
    return GeneratorKind::NONE;
}

std::string generator_kind_str(GeneratorKind kind) {
    switch (kind) {
        case GeneratorKind::IC_BOX:    return "IC_Box";
        case GeneratorKind::CONNECTOR: return "Connector";
        case GeneratorKind::STATIC:    return "Static";
        case GeneratorKind::NONE:      return "None";
    }
    return "None";
}

// ── helpers ─────────────────────────────────────────────────────────

static std::vector<std::string> read_string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

static void read_field_mapping(const json& tj, SymbolTemplate& tmpl) {
    if (!tj.contains("field_mapping") || !tj["field_mapping"].is_object()) return;
    for (auto& [prop, src] : tj["field_mapping"].items()) {
        FieldMapping fm;
        fm.property = prop;
        std::string text = src.is_string() ? src.get<std::string>() : src.dump();
        fm.literal = unquote_literal(text, fm.source);
        if (!fm.literal) fm.source = text;
        tmpl.field_mapping.push_back(fm);
    }
}

static void read_property_templates(const json& tj, SymbolTemplate& tmpl) {
    if (!tj.contains("property_templates") || !tj["property_templates"].is_object()) return;
    for (auto& [prop, pattern] : tj["property_templates"].items()) {
        if (pattern.is_string()) tmpl.property_templates[prop] = pattern.get<std::string>();
    }
}

static SymbolTemplate read_template(const std::string& name, const json& tj) {
    SymbolTemplate tmpl;
    tmpl.name = name;
    tmpl.applies_to_categories = read_string_list(tj, "applies_to_categories");
    tmpl.power_pin_names = read_string_list(tj, "power_pin_names");
    tmpl.symbol_options = trim(tj.value("symbol_options", ""));
    tmpl.symbol_template = tj.value("symbol_template", "");
    read_field_mapping(tj, tmpl);
    read_property_templates(tj, tmpl);

    std::string gen = tj.value("symbol_generator", "");
    tmpl.generator = parse_generator_kind(gen);
    if (tmpl.generator == GeneratorKind::NONE || tmpl.generator == GeneratorKind::STATIC) {
        if (!gen.empty() && gen != "Static") {
            std::cerr << "[WARNING] Template '" << name << "': unknown symbol_generator '"
                      << gen << "', using symbol_template\n";
        }
        tmpl.generator = trim(tmpl.symbol_template).empty() ? GeneratorKind::NONE
                                                            : GeneratorKind::STATIC;
    }
    return tmpl;
}

// ── public API ──────────────────────────────────────────────────────

bool read_templates(std::istream& in, TemplateSet& set) {
    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            std::cerr << "Template error: top level must be an object of templates\n";
            return false;
        }

        for (auto& [name, tj] : j.items()) {
            if (!tj.is_object()) {
                std::cerr << "[WARNING] Template '" << name << "' is not an object, skipped\n";
                continue;
            }
            set.add(read_template(name, tj));
        }

        if (set.empty()) {
            std::cerr << "Template error: no templates declared\n";
            return false;
        }
        return true;
    } catch (const json::exception& e) {
        std::cerr << "Template JSON parse error: " << e.what() << "\n";
        return false;
    }
}

bool read_templates(const std::string& json_text, TemplateSet& set) {
    std::istringstream iss(json_text);
    return read_templates(iss, set);
}

bool read_templates_file(const std::string& filename, TemplateSet& set) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        std::cerr << "Error: template file not found: " << filename << "\n";
        return false;
    }
    return read_templates(in, set);
}

} // namespace partdb2kicad
