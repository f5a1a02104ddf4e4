#pragma once

#include "part_model.h"
#include <istream>
#include <string>
#include <vector>

namespace partdb2kicad {

// Ordered set of category templates. Declaration order decides which
// template wins when several match.
class TemplateSet {
public:
    void add(SymbolTemplate tmpl) { templates_.push_back(std::move(tmpl)); }

    // First template whose applies_to_categories entry is a case-insensitive
    // suffix of category_path, or nullptr.
    const SymbolTemplate* match(const std::string& category_path) const;

    const std::vector<SymbolTemplate>& templates() const { return templates_; }
    size_t size() const { return templates_.size(); }
    bool empty() const { return templates_.empty(); }

private:
    std::vector<SymbolTemplate> templates_;
};

GeneratorKind parse_generator_kind(const std::string& s);
std::string generator_kind_str(GeneratorKind kind);

// Read template configuration JSON into a TemplateSet. Returns false on
// parse error or when the file declares no templates.
bool read_templates(std::istream& in, TemplateSet& set);
bool read_templates(const std::string& json_text, TemplateSet& set);
bool read_templates_file(const std::string& filename, TemplateSet& set);

} // namespace partdb2kicad
