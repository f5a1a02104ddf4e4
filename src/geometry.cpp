#include "geometry.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace partdb2kicad {

static const double GENDER_INSET = 0.635;   // gap between box edge and overlay
static const double MALE_REACH = 2.54;      // male overlay ends here from the edge
static const double FEMALE_LINE_END = 1.905;
static const double FEMALE_RADIUS = 0.635;

double box_height(int side_pin_count, int min_grid) {
    int grids = std::max(min_grid, side_pin_count > 0 ? side_pin_count - 1 : 0);
    return grids * GRID_SPACING + GRID_SPACING;
}

static GeometryResult box_geometry(double width, int side_pin_count, int min_grid) {
    GeometryResult g;
    g.box_top = box_height(side_pin_count, min_grid) / 2.0;
    g.box_left = -width / 2.0;
    return g;
}

// First pin sits at the top, the column is centered on y = 0
static double column_start_y(int count) {
    return (count - 1) * GRID_SPACING / 2.0;
}

// ── IC box ──────────────────────────────────────────────────────────

std::vector<PinSpec> parse_pin_list(const std::string& csv,
                                    const std::vector<std::string>& power_names) {
    std::set<std::string> power_upper;
    for (auto& n : power_names) power_upper.insert(to_upper(trim(n)));

    std::vector<PinSpec> pins;
    int index = 1;
    for (auto& name : split_trimmed(csv, ',')) {
        PinSpec p;
        p.index = index++;
        p.name = name;
        p.role = power_upper.count(to_upper(name)) ? PinRole::POWER : PinRole::PASSIVE;
        pins.push_back(p);
    }
    return pins;
}

static UnitLayout build_ic_unit(int unit_number, const std::vector<PinSpec>& pins) {
    UnitLayout unit;
    unit.unit_number = unit_number;

    int total = static_cast<int>(pins.size());
    int left_count = (total + 1) / 2;
    int right_count = total / 2;
    int min_grid = (unit_number == 1) ? IC_UNIT_A_MIN_GRID : IC_UNIT_B_MIN_GRID;
    unit.box = box_geometry(IC_BOX_WIDTH, std::max(left_count, right_count), min_grid);

    double pin_x_left = -IC_BOX_WIDTH / 2.0 - PIN_LENGTH;
    double pin_x_right = IC_BOX_WIDTH / 2.0 + PIN_LENGTH;

    size_t next = 0;
    for (int i = 0; i < left_count; i++) {
        PinPlacement pp;
        pp.pin = pins[next++];
        pp.at = {pin_x_left, column_start_y(left_count) - i * GRID_SPACING};
        pp.angle = 0;
        unit.pins.push_back(pp);
    }
    for (int i = 0; i < right_count; i++) {
        PinPlacement pp;
        pp.pin = pins[next++];
        pp.at = {pin_x_right, column_start_y(right_count) - i * GRID_SPACING};
        pp.angle = 180;
        unit.pins.push_back(pp);
    }
    return unit;
}

SymbolLayout layout_ic_box(const std::vector<PinSpec>& pins) {
    std::vector<PinSpec> main_pins, power_pins;
    for (auto& p : pins) {
        if (p.role == PinRole::POWER) power_pins.push_back(p);
        else main_pins.push_back(p);
    }

    SymbolLayout layout;
    bool split = !main_pins.empty() && !power_pins.empty();
    if (split) {
        layout.units.push_back(build_ic_unit(1, main_pins));
        layout.units.push_back(build_ic_unit(2, power_pins));
    } else {
        // Only one group is non-empty here, so original order is kept
        layout.units.push_back(build_ic_unit(1, pins));
    }
    layout.geometry = layout.units.front().box;
    return layout;
}

// ── Connector ───────────────────────────────────────────────────────

ConnectorParams resolve_connector_params(const ConnectorInputs& in) {
    ConnectorParams p;
    p.rows = parse_int(in.rows, 1);
    p.pins_per_row = parse_int(in.pins_per_row, 0);

    if (p.pins_per_row == 0) {
        std::string total_text = in.number_of_pins.empty() ? in.pin_count : in.number_of_pins;
        int total = parse_int(total_text, 0);
        if (total > 0) {
            if (p.rows == 1) {
                p.pins_per_row = total;
            } else if (p.rows > 1) {
                p.pins_per_row = (total + p.rows - 1) / p.rows;
            }
        }
    }

    if (p.pins_per_row <= 0) p.pins_per_row = 1;
    if (p.rows <= 0) p.rows = 1;

    bool by_line = iequals(trim(in.annotation), "line");
    p.numbering = (p.rows > 1 && by_line) ? PinNumbering::LINE : PinNumbering::ROW;

    std::string gender = trim(in.gender);
    if (iequals(gender, "male")) p.gender = ConnectorGender::MALE;
    else if (iequals(gender, "female")) p.gender = ConnectorGender::FEMALE;
    return p;
}

// Overlay drawn inside the box next to one pin. `edge` is the box edge on
// the pin's side, `dir` points into the box (+1 left side, -1 right side).
static void add_gender_overlay(PinPlacement& pp, ConnectorGender gender,
                               double edge, double dir) {
    double y = pp.at.y;
    if (gender == ConnectorGender::MALE) {
        pp.overlay_lines.push_back({{edge + dir * GENDER_INSET, y},
                                    {edge + dir * MALE_REACH, y}});
    } else if (gender == ConnectorGender::FEMALE) {
        double mid_x = edge + dir * FEMALE_LINE_END;
        double base_x = edge + dir * (FEMALE_LINE_END + FEMALE_RADIUS);
        pp.overlay_lines.push_back({{edge + dir * GENDER_INSET, y}, {mid_x, y}});
        pp.overlay_arcs.push_back({{base_x, y + FEMALE_RADIUS},
                                   {mid_x, y},
                                   {base_x, y - FEMALE_RADIUS}});
    }
}

SymbolLayout layout_connector(const ConnectorParams& params) {
    UnitLayout unit;
    unit.unit_number = 1;

    bool single_row = params.rows == 1;
    double width = single_row ? CONNECTOR_SINGLE_ROW_WIDTH : CONNECTOR_MULTI_ROW_WIDTH;
    // Two or more rows are drawn as two facing columns
    int left_count = params.pins_per_row;
    int right_count = single_row ? 0 : params.pins_per_row;
    unit.box = box_geometry(width, std::max(left_count, right_count), CONNECTOR_MIN_GRID);

    double left = unit.box.box_left;
    double right = -left;
    double pin_x_left = left - PIN_LENGTH;
    double pin_x_right = right + PIN_LENGTH;

    auto place = [&](int number, bool on_left, int row) {
        PinPlacement pp;
        pp.pin.index = number;
        pp.pin.name = std::to_string(number);
        pp.name_hidden = true;
        double y = column_start_y(on_left ? left_count : right_count) - row * GRID_SPACING;
        pp.at = {on_left ? pin_x_left : pin_x_right, y};
        pp.angle = on_left ? 0 : 180;
        add_gender_overlay(pp, params.gender, on_left ? left : right, on_left ? 1.0 : -1.0);
        unit.pins.push_back(pp);
    };

    int number = 1;
    if (params.numbering == PinNumbering::LINE) {
        // 1 3 5 ... on the left, 2 4 6 ... on the right
        for (int i = 0; i < params.pins_per_row; i++) {
            place(number++, true, i);
            if (right_count > 0) place(number++, false, i);
        }
    } else {
        for (int i = 0; i < left_count; i++) place(number++, true, i);
        for (int i = 0; i < right_count; i++) place(number++, false, i);
    }

    SymbolLayout layout;
    layout.units.push_back(unit);
    layout.geometry = unit.box;
    return layout;
}

} // namespace partdb2kicad
