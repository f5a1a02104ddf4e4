#pragma once

#include "library_reconciler.h"
#include <istream>
#include <string>

namespace partdb2kicad {

// Run settings. Loaded from a JSON config file, then overridden by
// command-line flags.
struct LinkerConfig {
    std::string parts_file;
    std::string template_file = "templates.json";
    std::string output_dir = "kicad_libs";
    std::string library_version = "20211014";
    std::string generator = "partdb_linker";
    bool verbose = false;

    ReconcilerOptions reconciler_options() const;
};

// Keys missing from the file keep their current value in cfg.
bool read_config(std::istream& in, LinkerConfig& cfg);
bool read_config_file(const std::string& filename, LinkerConfig& cfg);

} // namespace partdb2kicad
