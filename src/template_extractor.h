#pragma once

#include "part_model.h"
#include <ostream>
#include <string>
#include <vector>

namespace partdb2kicad {

struct ExtractorOptions {
    bool verbose = false;
};

// Turns a hand-drawn symbol from an existing .kicad_sym library into a
// STATIC template: its options, pins and child units become the
// symbol_template body, and every property becomes a property template
// with the value replaced by {VALUE}.
class TemplateExtractor {
public:
    explicit TemplateExtractor(const ExtractorOptions& opts = {});

    bool extract(const std::string& library_text, const std::string& symbol_name,
                 SymbolTemplate& tmpl);
    bool extract_file(const std::string& library_path, const std::string& symbol_name,
                      SymbolTemplate& tmpl);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    ExtractorOptions opts_;
    std::vector<std::string> warnings_;

    std::string extract_options(const std::string& block);
    std::string extract_body(const std::string& block, const std::string& symbol_name);
    // Fills property_templates; `reference` receives the Reference value
    void extract_properties(const std::string& block, SymbolTemplate& tmpl,
                            std::string& reference);

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

// Write a ready-to-edit template file holding one template. An empty
// category defaults to "<template name>_Category".
void write_template_json(std::ostream& out, const SymbolTemplate& tmpl,
                         const std::string& category = "");

} // namespace partdb2kicad
