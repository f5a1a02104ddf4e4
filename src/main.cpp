#include "linker_config.h"
#include "library_reconciler.h"
#include "part_import.h"
#include "template_config.h"
#include "template_extractor.h"
#include "utils.h"

#include <iostream>
#include <set>
#include <string>
#include <vector>

static void print_help() {
    std::cout << "Usage: partdb-to-kicad [options]\n"
              << "\n"
              << "Build and update KiCad symbol libraries (.kicad_sym) from Part-DB parts.\n"
              << "Without an --apply option the run only reports what would change.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config <file>       JSON run configuration\n"
              << "  -p, --parts <file>        Part records JSON (array or API page)\n"
              << "  -t, --templates <file>    Template file (default: templates.json)\n"
              << "  -o, --output <dir>        Library output directory (default: kicad_libs)\n"
              << "  --apply-all               Write every new and modified part\n"
              << "  --apply-new               Write new parts only\n"
              << "  --apply <id,id,...>       Write the listed part ids\n"
              << "  --extract-template <lib>  Print a template built from a library symbol\n"
              << "  --symbol <name>           Symbol to extract (with --extract-template)\n"
              << "  --category <name>         Category for the extracted template\n"
              << "  --verbose                 Verbose output\n"
              << "  -h, --help                Show help\n";
}

enum class ApplyMode { NONE, ALL, NEW_ONLY, IDS };

static bool parse_id_list(const std::string& text, std::set<long>& ids) {
    for (auto& field : partdb2kicad::split_trimmed(text, ',')) {
        long id = partdb2kicad::parse_long(field, -1);
        if (id < 0) {
            std::cerr << "Error: invalid part id '" << field << "'\n";
            return false;
        }
        ids.insert(id);
    }
    return !ids.empty();
}

static void print_changes(const partdb2kicad::LibraryReconciler& reconciler) {
    auto& changes = reconciler.changes();
    if (!changes.new_parts.empty()) {
        std::cout << "New parts (" << changes.new_parts.size() << "):\n";
        for (auto& p : changes.new_parts) {
            std::cout << "  [" << p.id << "] " << p.name << "  (" << p.category_path() << ")\n";
        }
    }
    if (!changes.modified_parts.empty()) {
        std::cout << "Modified parts (" << changes.modified_parts.size() << "):\n";
        for (auto& p : changes.modified_parts) {
            std::cout << "  [" << p.id << "] " << p.name << "  (" << p.category_path() << ")\n";
        }
    }
}

static void print_diagnostics(const partdb2kicad::LibraryReconciler& reconciler) {
    if (reconciler.diagnostics().empty()) return;
    std::cout << "Diagnostics (" << reconciler.diagnostics().size() << "):\n";
    for (auto& d : reconciler.diagnostics()) {
        std::cout << "  " << partdb2kicad::diagnostic_kind_str(d.kind) << ": " << d.message << "\n";
    }
}

static int run_extract(const std::string& library, const std::string& symbol,
                       const std::string& category, bool verbose) {
    if (symbol.empty()) {
        std::cerr << "Error: --extract-template requires --symbol <name>\n";
        return 1;
    }

    partdb2kicad::ExtractorOptions opts;
    opts.verbose = verbose;
    partdb2kicad::TemplateExtractor extractor(opts);

    partdb2kicad::SymbolTemplate tmpl;
    if (!extractor.extract_file(library, symbol, tmpl)) {
        std::cerr << "Error: failed to extract '" << symbol << "' from " << library << "\n";
        return 1;
    }
    partdb2kicad::write_template_json(std::cout, tmpl, category);
    return 0;
}

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string parts_file;
    std::string template_file;
    std::string output_dir;
    std::string extract_library;
    std::string extract_symbol;
    std::string extract_category;
    ApplyMode apply = ApplyMode::NONE;
    std::set<long> apply_ids;
    bool verbose = false;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto need_value = [&](const char* name) -> bool {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << name << " requires an argument\n";
                return false;
            }
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (!need_value("-c")) return 1;
            config_file = argv[++i];
        } else if (arg == "-p" || arg == "--parts") {
            if (!need_value("-p")) return 1;
            parts_file = argv[++i];
        } else if (arg == "-t" || arg == "--templates") {
            if (!need_value("-t")) return 1;
            template_file = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (!need_value("-o")) return 1;
            output_dir = argv[++i];
        } else if (arg == "--apply-all") {
            apply = ApplyMode::ALL;
        } else if (arg == "--apply-new") {
            apply = ApplyMode::NEW_ONLY;
        } else if (arg == "--apply") {
            if (!need_value("--apply")) return 1;
            if (!parse_id_list(argv[++i], apply_ids)) {
                std::cerr << "Error: --apply needs a comma-separated list of part ids\n";
                return 1;
            }
            apply = ApplyMode::IDS;
        } else if (arg == "--extract-template") {
            if (!need_value("--extract-template")) return 1;
            extract_library = argv[++i];
        } else if (arg == "--symbol") {
            if (!need_value("--symbol")) return 1;
            extract_symbol = argv[++i];
        } else if (arg == "--category") {
            if (!need_value("--category")) return 1;
            extract_category = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            print_help();
            return 1;
        }
    }

    if (!extract_library.empty()) {
        return run_extract(extract_library, extract_symbol, extract_category, verbose);
    }

    // Config file first, flags override it
    partdb2kicad::LinkerConfig cfg;
    if (!config_file.empty() && !partdb2kicad::read_config_file(config_file, cfg)) {
        return 1;
    }
    if (!parts_file.empty()) cfg.parts_file = parts_file;
    if (!template_file.empty()) cfg.template_file = template_file;
    if (!output_dir.empty()) cfg.output_dir = output_dir;
    if (verbose) cfg.verbose = true;

    if (cfg.parts_file.empty()) {
        std::cerr << "Error: no parts file specified\n";
        print_help();
        return 1;
    }

    partdb2kicad::TemplateSet templates;
    if (!partdb2kicad::read_templates_file(cfg.template_file, templates)) {
        std::cerr << "Error: failed to load templates from " << cfg.template_file << "\n";
        return 1;
    }

    std::vector<partdb2kicad::PartRecord> parts;
    if (!partdb2kicad::read_parts_file(cfg.parts_file, parts)) {
        std::cerr << "Error: failed to read parts from " << cfg.parts_file << "\n";
        return 1;
    }

    partdb2kicad::LibraryReconciler reconciler(templates, cfg.reconciler_options());
    if (!reconciler.compare(parts)) {
        print_diagnostics(reconciler);
        std::cerr << "Error: " << reconciler.error() << "\n";
        return 1;
    }

    print_changes(reconciler);
    print_diagnostics(reconciler);

    if (reconciler.stage() == partdb2kicad::ReconcileStage::UP_TO_DATE) {
        std::cout << "All libraries are up-to-date.\n";
        return 0;
    }

    std::set<long> selected;
    switch (apply) {
        case ApplyMode::NONE:
            std::cout << "Dry run: use --apply-all, --apply-new or --apply <ids> to write.\n";
            return 0;
        case ApplyMode::ALL:      selected = reconciler.change_ids(); break;
        case ApplyMode::NEW_ONLY: selected = reconciler.new_part_ids(); break;
        case ApplyMode::IDS:      selected = apply_ids; break;
    }

    if (!reconciler.commit(selected)) {
        std::cerr << "Error: " << reconciler.error() << "\n";
        return 1;
    }

    if (reconciler.committed_files().empty()) {
        std::cout << "No selected changes, nothing written.\n";
    }
    for (auto& f : reconciler.committed_files()) {
        std::cout << "Updated " << f << "\n";
    }
    return 0;
}
