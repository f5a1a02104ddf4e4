#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <utility>

namespace partdb2kicad {

struct CategoryRef {
    std::string name;       // leaf category name
    std::string full_path;  // e.g. "Active → ICs → OpAmp"
};

// One part as delivered by the fetch collaborator. Read-only to the core.
struct PartRecord {
    long id = 0;
    std::string name;
    CategoryRef category;
    bool has_category = false;

    // Remaining fixed attributes (description, footprint, manufacturer, ...)
    // kept as a tree so dotted paths like "footprint.name" can walk it.
    nlohmann::ordered_json attributes = nlohmann::ordered_json::object();

    // Parameter bag in delivery order: name -> value text
    std::vector<std::pair<std::string, std::string>> parameters;

    // Category path used for template matching and library grouping
    std::string category_path() const {
        if (!has_category) return "Uncategorized";
        if (!category.full_path.empty()) return category.full_path;
        if (!category.name.empty()) return category.name;
        return "Uncategorized";
    }

    const std::string* parameter(const std::string& key) const {
        for (auto& [k, v] : parameters) {
            if (k == key) return &v;
        }
        return nullptr;
    }
};

enum class GeneratorKind {
    NONE,       // no template graphics: diagnostic placeholder
    STATIC,     // literal graphics/pins from symbol_template
    IC_BOX,     // generated rectangle with main/power units
    CONNECTOR   // generated pin header
};

struct FieldMapping {
    std::string property;  // target property name
    std::string source;    // source path, or the literal text
    bool literal = false;
};

// Per-category template configuration
struct SymbolTemplate {
    std::string name;
    std::vector<std::string> applies_to_categories;
    std::vector<FieldMapping> field_mapping;                  // declaration order
    std::map<std::string, std::string> property_templates;    // property -> pattern with {VALUE}
    GeneratorKind generator = GeneratorKind::NONE;
    std::vector<std::string> power_pin_names;
    std::string symbol_options;
    std::string symbol_template;  // static body (STATIC kind)

    const std::string* property_template(const std::string& property) const {
        auto it = property_templates.find(property);
        return it != property_templates.end() ? &it->second : nullptr;
    }
};

// One rendered top-level symbol. Built fresh every pass, never mutated.
struct SymbolBlock {
    std::string symbol_name;
    std::string text;
};

struct ChangeSet {
    std::vector<PartRecord> new_parts;
    std::vector<PartRecord> modified_parts;

    bool empty() const { return new_parts.empty() && modified_parts.empty(); }
};

} // namespace partdb2kicad
