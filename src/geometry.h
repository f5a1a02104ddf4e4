#pragma once

#include <string>
#include <vector>

namespace partdb2kicad {

constexpr double GRID_SPACING = 2.54;   // 100mil schematic pitch
constexpr double PIN_LENGTH = 2.54;
constexpr double IC_BOX_WIDTH = 15.24;  // 600mil
constexpr double CONNECTOR_SINGLE_ROW_WIDTH = 3.81;
constexpr double CONNECTOR_MULTI_ROW_WIDTH = 7.62;

// Minimum box height in grid units
constexpr int IC_UNIT_A_MIN_GRID = 3;
constexpr int IC_UNIT_B_MIN_GRID = 2;
constexpr int CONNECTOR_MIN_GRID = 2;

struct Point {
    double x = 0.0;
    double y = 0.0;

    Point() = default;
    Point(double x, double y) : x(x), y(y) {}
};

struct Segment {
    Point start, end;
};

struct ArcGeom {
    Point start, mid, end;
};

enum class PinRole { POWER, PASSIVE };

struct PinSpec {
    int index = 0;          // 1-based pin number
    std::string name;
    PinRole role = PinRole::PASSIVE;
};

struct PinPlacement {
    PinSpec pin;
    Point at;               // pin tip
    int angle = 0;          // 0 = left side, 180 = right side
    bool name_hidden = false;
    // Gender overlay drawn inside the box next to this pin (connectors only)
    std::vector<Segment> overlay_lines;
    std::vector<ArcGeom> overlay_arcs;

    const char* electrical_type() const {
        return pin.role == PinRole::POWER ? "power_in" : "passive";
    }
};

// Box is symmetric about the origin: right = -box_left, bottom = -box_top
struct GeometryResult {
    double box_top = 3.81;
    double box_left = 0.0;
};

struct UnitLayout {
    int unit_number = 1;
    GeometryResult box;
    std::vector<PinPlacement> pins;
};

struct SymbolLayout {
    std::vector<UnitLayout> units;
    GeometryResult geometry;  // geometry of unit 1, used for property placement
};

// ── IC box ──────────────────────────────────────────────────────────

// Parse "IN+,IN-,VCC" into (1,"IN+"), (2,"IN-"), (3,"VCC"). Roles come from a
// case-insensitive match against power_names.
std::vector<PinSpec> parse_pin_list(const std::string& csv,
                                    const std::vector<std::string>& power_names);

// Main pins go to unit 1 and power pins to unit 2 when both groups exist;
// otherwise every pin is placed in unit 1.
SymbolLayout layout_ic_box(const std::vector<PinSpec>& pins);

// ── Connector ───────────────────────────────────────────────────────

enum class PinNumbering { ROW, LINE };
enum class ConnectorGender { NONE, MALE, FEMALE };

// Raw parameter text as resolved from the part
struct ConnectorInputs {
    std::string rows;           // "Number of Rows"
    std::string pins_per_row;   // "Pins per Row"
    std::string number_of_pins; // "Number of Pins"
    std::string pin_count;      // "Pin Count"
    std::string annotation;     // "Pin Annotation": "row" | "line"
    std::string gender;         // "Gender": "male" | "female"
};

struct ConnectorParams {
    int rows = 1;
    int pins_per_row = 1;
    PinNumbering numbering = PinNumbering::ROW;
    ConnectorGender gender = ConnectorGender::NONE;
};

ConnectorParams resolve_connector_params(const ConnectorInputs& in);

SymbolLayout layout_connector(const ConnectorParams& params);

// ── Shared ──────────────────────────────────────────────────────────

// Total box height for the larger pin side count
double box_height(int side_pin_count, int min_grid);

} // namespace partdb2kicad
