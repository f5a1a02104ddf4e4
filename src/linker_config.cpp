#include "linker_config.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace partdb2kicad {

ReconcilerOptions LinkerConfig::reconciler_options() const {
    ReconcilerOptions opts;
    opts.output_dir = output_dir;
    opts.library_version = library_version;
    opts.generator = generator;
    opts.verbose = verbose;
    return opts;
}

static void read_string(const json& j, const char* key, std::string& field) {
    if (j.contains(key) && j[key].is_string()) field = j[key].get<std::string>();
}

bool read_config(std::istream& in, LinkerConfig& cfg) {
    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            std::cerr << "Config error: top level must be an object\n";
            return false;
        }

        read_string(j, "parts_file", cfg.parts_file);
        read_string(j, "template_file", cfg.template_file);
        read_string(j, "output_dir", cfg.output_dir);
        read_string(j, "library_version", cfg.library_version);
        read_string(j, "generator", cfg.generator);
        cfg.verbose = j.value("verbose", cfg.verbose);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "Config JSON parse error: " << e.what() << "\n";
        return false;
    }
}

bool read_config_file(const std::string& filename, LinkerConfig& cfg) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        std::cerr << "Error: cannot open config file " << filename << "\n";
        return false;
    }
    return read_config(in, cfg);
}

} // namespace partdb2kicad
