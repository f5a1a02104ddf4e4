#pragma once

#include "part_model.h"
#include "geometry.h"
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>

namespace partdb2kicad {

// Raised when one record cannot be rendered. The reconciler catches it per
// record.
class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& msg) : std::runtime_error(msg) {}
};

struct RendererOptions {
    bool verbose = false;
};

// Ordered property set: name -> resolved value
using PropertyList = std::vector<std::pair<std::string, std::string>>;

class SymbolRenderer {
public:
    explicit SymbolRenderer(const RendererOptions& opts = {});

    // Render one part into a complete top-level (symbol ...) block.
    // Throws RenderError if the part cannot be rendered.
    SymbolBlock render(const PartRecord& part, const SymbolTemplate& tmpl);

    // Part name with spaces replaced, the unique key inside a library
    static std::string symbol_name_for(const PartRecord& part);

    // Resolve field_mapping entries first, then append remaining non-empty
    // parameters.
    static PropertyList build_properties(const PartRecord& part, const SymbolTemplate& tmpl);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    RendererOptions opts_;
    std::vector<std::string> warnings_;

    SymbolLayout generate_layout(const PartRecord& part, const SymbolTemplate& tmpl) const;

    void write_header(std::ostream& out, const std::string& symbol_name,
                      const std::string& options) const;
    void write_property(std::ostream& out, const std::string& name, const std::string& value,
                        const SymbolTemplate& tmpl) const;
    void write_placed_property(std::ostream& out, const std::string& name,
                               const std::string& value, const Point& at,
                               const SymbolTemplate& tmpl) const;
    void write_unit(std::ostream& out, const std::string& symbol_name,
                    const UnitLayout& unit) const;
    void write_static_body(std::ostream& out, const std::string& symbol_name,
                           const std::string& body) const;

    void log(const std::string& msg) const;
    void warn(const std::string& msg);
};

} // namespace partdb2kicad
