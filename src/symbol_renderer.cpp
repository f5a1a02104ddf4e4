#include "symbol_renderer.h"
#include "value_resolver.h"
#include "utils.h"

#include <iostream>
#include <sstream>
#include <regex>
#include <set>

namespace partdb2kicad {

static const char* DEFAULT_FONT = "(size 1.27 1.27)";
static const double PROPERTY_OFFSET = 1.27;  // gap between box edge and label
static const double DESCRIPTION_GAP = 2.54;  // Description sits below the part number

SymbolRenderer::SymbolRenderer(const RendererOptions& opts)
    : opts_(opts) {}

std::string SymbolRenderer::symbol_name_for(const PartRecord& part) {
    return replace_all(part.name, " ", "_");
}

PropertyList SymbolRenderer::build_properties(const PartRecord& part,
                                              const SymbolTemplate& tmpl) {
    PropertyList props;
    std::set<std::string> seen;

    for (auto& fm : tmpl.field_mapping) {
        std::string value;
        if (fm.literal) {
            value = fm.source;
        } else {
            value = resolve(part, fm.source);
            // A mapping like "Resistance": "resistance" falls back to the
            // property's own name
            if (value.empty()) value = resolve(part, fm.property);
        }
        if (seen.insert(fm.property).second) {
            props.emplace_back(fm.property, value);
        }
    }

    for (auto& [name, raw] : part.parameters) {
        if (raw.empty() || seen.count(name)) continue;
        seen.insert(name);
        props.emplace_back(name, resolve(part, name));
    }
    return props;
}

SymbolLayout SymbolRenderer::generate_layout(const PartRecord& part,
                                             const SymbolTemplate& tmpl) const {
    if (tmpl.generator == GeneratorKind::IC_BOX) {
        auto pins = parse_pin_list(resolve(part, "Pin Description"), tmpl.power_pin_names);
        log("IC box for " + part.name + ": " + std::to_string(pins.size()) + " pins");
        return layout_ic_box(pins);
    }

    ConnectorInputs in;
    in.rows           = resolve(part, "Number of Rows");
    in.pins_per_row   = resolve(part, "Pins per Row");
    in.number_of_pins = resolve(part, "Number of Pins");
    in.pin_count      = resolve(part, "Pin Count");
    in.annotation     = resolve(part, "Pin Annotation");
    in.gender         = resolve(part, "Gender");
    auto params = resolve_connector_params(in);
    log("Connector for " + part.name + ": " + std::to_string(params.rows) + " rows x " +
        std::to_string(params.pins_per_row) + " pins");
    return layout_connector(params);
}

SymbolBlock SymbolRenderer::render(const PartRecord& part, const SymbolTemplate& tmpl) {
    if (trim(part.name).empty()) {
        throw RenderError("part " + std::to_string(part.id) + " has no name");
    }
    std::string symbol_name = symbol_name_for(part);

    PropertyList props = build_properties(part, tmpl);
    std::ostringstream out;

    switch (tmpl.generator) {
        case GeneratorKind::IC_BOX:
        case GeneratorKind::CONNECTOR: {
            SymbolLayout layout = generate_layout(part, tmpl);
            const GeometryResult& g = layout.geometry;
            double box_bottom = -g.box_top;
            Point ref_at(g.box_left, g.box_top + PROPERTY_OFFSET);
            Point mpn_at(g.box_left, box_bottom - PROPERTY_OFFSET);
            Point desc_at(g.box_left, mpn_at.y - DESCRIPTION_GAP);

            write_header(out, symbol_name, tmpl.symbol_options);
            for (auto& [name, value] : props) {
                if (name == "Reference") {
                    write_placed_property(out, name, value, ref_at, tmpl);
                } else if (name == "Manufacturer Partnumber") {
                    write_placed_property(out, name, value, mpn_at, tmpl);
                } else if (name == "Description") {
                    write_placed_property(out, name, value, desc_at, tmpl);
                } else {
                    write_property(out, name, value, tmpl);
                }
            }
            for (auto& unit : layout.units) {
                write_unit(out, symbol_name, unit);
            }
            break;
        }
        case GeneratorKind::STATIC:
            write_header(out, symbol_name, tmpl.symbol_options);
            for (auto& [name, value] : props) {
                write_property(out, name, value, tmpl);
            }
            write_static_body(out, symbol_name, tmpl.symbol_template);
            break;
        case GeneratorKind::NONE:
            warn("No symbol_template or symbol_generator in template '" + tmpl.name +
                 "', part '" + part.name + "' gets no graphics");
            write_header(out, symbol_name, "");
            out << "    (text " << sq("No template found for " + symbol_name)
                << " (at 0 0 0) (effects (font " << DEFAULT_FONT << ")))\n";
            break;
    }

    out << "  )";
    return {symbol_name, out.str()};
}

// ── Section writers ─────────────────────────────────────────────────

void SymbolRenderer::write_header(std::ostream& out, const std::string& symbol_name,
                                  const std::string& options) const {
    out << "  (symbol " << sq(symbol_name);
    if (!options.empty()) out << " " << collapse_whitespace(options);
    out << " (in_bom yes) (on_board yes)\n";
}

void SymbolRenderer::write_property(std::ostream& out, const std::string& name,
                                    const std::string& value,
                                    const SymbolTemplate& tmpl) const {
    if (const std::string* pattern = tmpl.property_template(name)) {
        out << "    " << replace_all(collapse_whitespace(*pattern), "{VALUE}", sexp_escape(value))
            << "\n";
        return;
    }
    out << "    (property " << sq(name) << " " << sq(value)
        << " (at 0 0 0) (effects (font " << DEFAULT_FONT << ") (hide yes)) )\n";
}

// Reference, part number and description follow the generated box; only
// the font size is taken from the configured template.
void SymbolRenderer::write_placed_property(std::ostream& out, const std::string& name,
                                           const std::string& value, const Point& at,
                                           const SymbolTemplate& tmpl) const {
    static const std::regex re_size(R"(\(size\s+([\d\.]+)\s+([\d\.]+)\))");

    std::string font = DEFAULT_FONT;
    if (const std::string* pattern = tmpl.property_template(name)) {
        std::smatch m;
        if (std::regex_search(*pattern, m, re_size)) {
            font = "(size " + m[1].str() + " " + m[2].str() + ")";
        }
    }

    out << "    (property " << sq(name) << " " << sq(value)
        << " (at " << fmt2(at.x) << " " << fmt2(at.y) << " 0)"
        << " (effects (font " << font << ") (justify left)) )\n";
}

void SymbolRenderer::write_unit(std::ostream& out, const std::string& symbol_name,
                                const UnitLayout& unit) const {
    static const char* overlay_stroke = "(stroke (width 0.2) (type default)) (fill (type none))";

    double left = unit.box.box_left;
    double top = unit.box.box_top;

    out << "    (symbol " << sq(symbol_name + "_" + std::to_string(unit.unit_number) + "_1") << "\n";
    out << "      (rectangle (start " << fmt2(left) << " " << fmt2(top) << ")"
        << " (end " << fmt2(-left) << " " << fmt2(-top) << ")\n";
    out << "        (stroke (width 0.254) (type default)) (fill (type background))\n";
    out << "      )\n";

    for (auto& pp : unit.pins) {
        out << "      (pin " << pp.electrical_type() << " line"
            << " (at " << fmt2(pp.at.x) << " " << fmt2(pp.at.y) << " " << pp.angle << ")"
            << " (length " << fmt(PIN_LENGTH) << ")\n";
        out << "        (name " << sq(pp.pin.name) << " (effects (font " << DEFAULT_FONT << ")"
            << (pp.name_hidden ? " (hide yes)" : "") << "))\n";
        out << "        (number " << sq(std::to_string(pp.pin.index))
            << " (effects (font " << DEFAULT_FONT << ")))\n";
        out << "      )\n";

        for (auto& seg : pp.overlay_lines) {
            out << "      (polyline (pts (xy " << fmt2(seg.start.x) << " " << fmt2(seg.start.y) << ")"
                << " (xy " << fmt2(seg.end.x) << " " << fmt2(seg.end.y) << ")) "
                << overlay_stroke << ")\n";
        }
        for (auto& arc : pp.overlay_arcs) {
            out << "      (arc (start " << fmt2(arc.start.x) << " " << fmt2(arc.start.y) << ")"
                << " (mid " << fmt2(arc.mid.x) << " " << fmt2(arc.mid.y) << ")"
                << " (end " << fmt2(arc.end.x) << " " << fmt2(arc.end.y) << ") "
                << overlay_stroke << ")\n";
        }
    }

    out << "    )\n";
}

// Copy the template's literal graphics/pins, renaming its child units
// ("R_0_1") after this symbol.
void SymbolRenderer::write_static_body(std::ostream& out, const std::string& symbol_name,
                                       const std::string& body) const {
    static const std::regex re_unit(R"re((\(symbol\s+")(.*?)(_\d+_\d+"))re");

    std::string renamed;
    auto begin = std::sregex_iterator(body.begin(), body.end(), re_unit);
    auto end = std::sregex_iterator();
    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        auto& m = *it;
        size_t pos = static_cast<size_t>(m.position(0));
        renamed += body.substr(last, pos - last);
        renamed += m[1].str() + sexp_escape(symbol_name) + m[3].str();
        last = pos + static_cast<size_t>(m.length(0));
    }
    renamed += body.substr(last);

    std::istringstream lines(renamed);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;
        out << "  " << line << "\n";
    }
}

void SymbolRenderer::log(const std::string& msg) const {
    if (opts_.verbose) {
        std::cerr << "[render] " << msg << "\n";
    }
}

void SymbolRenderer::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace partdb2kicad
