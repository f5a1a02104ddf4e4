#include "part_import.h"
#include "value_resolver.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::ordered_json;

namespace partdb2kicad {

// ── helpers ─────────────────────────────────────────────────────────

static long read_id(const json& pj) {
    if (!pj.contains("id")) return 0;
    auto& id = pj["id"];
    if (id.is_number_integer()) return id.get<long>();
    if (id.is_string()) {
        try {
            return std::stol(id.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

static void read_category(const json& pj, PartRecord& part) {
    if (!pj.contains("category")) return;
    auto& cj = pj["category"];
    if (cj.is_object()) {
        part.category.name      = cj.contains("name") && cj["name"].is_string()
                                  ? cj["name"].get<std::string>() : "";
        part.category.full_path = cj.contains("full_path") && cj["full_path"].is_string()
                                  ? cj["full_path"].get<std::string>() : "";
        part.has_category = true;
    } else if (cj.is_string()) {
        part.category.name = cj.get<std::string>();
        part.category.full_path = part.category.name;
        part.has_category = true;
    }
}

// Parameters come either as a flat object or as the detailed
// [{name, value_text}] list fetched per parameter
static void read_parameters(const json& pj, PartRecord& part) {
    if (!pj.contains("parameters")) return;
    auto& params = pj["parameters"];

    if (params.is_object()) {
        for (auto& [name, val] : params.items()) {
            part.parameters.emplace_back(name, value_text(val));
        }
    } else if (params.is_array()) {
        for (auto& entry : params) {
            if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string())
                continue;
            std::string name = entry["name"].get<std::string>();
            if (name.empty()) continue;
            std::string value;
            if (entry.contains("value_text")) value = value_text(entry["value_text"]);
            part.parameters.emplace_back(name, value.empty() ? "-" : value);
        }
    }
}

static PartRecord read_part(const json& pj) {
    PartRecord part;
    part.id = read_id(pj);
    part.name = pj.contains("name") && pj["name"].is_string() ? pj["name"].get<std::string>() : "";
    read_category(pj, part);
    read_parameters(pj, part);

    for (auto& [key, val] : pj.items()) {
        if (key == "id" || key == "name" || key == "category" || key == "parameters") continue;
        part.attributes[key] = val;
    }
    return part;
}

// ── public API ──────────────────────────────────────────────────────

bool read_parts_json(std::istream& in, std::vector<PartRecord>& parts) {
    try {
        json j = json::parse(in);

        const json* members = &j;
        if (j.is_object()) {
            if (!j.contains("hydra:member")) {
                std::cerr << "Warning: API response does not contain 'hydra:member'\n";
                return true;
            }
            members = &j["hydra:member"];
        }
        if (!members->is_array()) {
            std::cerr << "Part JSON error: expected an array of parts\n";
            return false;
        }

        for (auto& pj : *members) {
            if (pj.is_object()) parts.push_back(read_part(pj));
        }
        return true;
    } catch (const json::exception& e) {
        std::cerr << "Part JSON parse error: " << e.what() << "\n";
        return false;
    }
}

bool read_parts_json(const std::string& json_text, std::vector<PartRecord>& parts) {
    std::istringstream iss(json_text);
    return read_parts_json(iss, parts);
}

bool read_parts_file(const std::string& filename, std::vector<PartRecord>& parts) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        std::cerr << "Error: cannot open " << filename << "\n";
        return false;
    }
    return read_parts_json(in, parts);
}

} // namespace partdb2kicad
