#include "library_reconciler.h"
#include "symbol_diff.h"
#include "utils.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace partdb2kicad {

static const char* CATEGORY_SEPARATOR = "\xE2\x86\x92";  // "→"

std::string diagnostic_kind_str(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::UNMATCHED_CATEGORY: return "unmatched-category";
        case DiagnosticKind::RENDER_FAILURE:     return "render-failure";
        case DiagnosticKind::PARSE_WARNING:      return "parse-warning";
        case DiagnosticKind::DUPLICATE_SYMBOL:   return "duplicate-symbol";
        case DiagnosticKind::IO_FAILURE:         return "io-failure";
    }
    return "unknown";
}

LibraryReconciler::LibraryReconciler(const TemplateSet& templates,
                                     const ReconcilerOptions& opts)
    : templates_(templates)
    , opts_(opts)
    , renderer_(RendererOptions{opts.verbose})
{}

std::string LibraryReconciler::library_name_for(const std::string& category_path) {
    std::string tail = category_path;
    auto sep = tail.rfind(CATEGORY_SEPARATOR);
    if (sep != std::string::npos) {
        tail = tail.substr(sep + std::string(CATEGORY_SEPARATOR).size());
    }
    tail = trim(tail);
    if (tail.empty()) return "Uncategorized";
    tail = replace_all(tail, " ", "_");
    return replace_all(tail, "/", "_");
}

std::string LibraryReconciler::library_path(const std::string& library_name) const {
    return (fs::path(opts_.output_dir) / (library_name + opts_.library_extension)).string();
}

std::string LibraryReconciler::library_text(const std::vector<std::string>& blocks) const {
    std::ostringstream out;
    out << "(kicad_symbol_lib (version " << opts_.library_version << ")"
        << " (generator " << opts_.generator << ")\n";
    for (auto& block : blocks) {
        out << block << "\n";
    }
    out << ")\n";
    return out.str();
}

std::set<long> LibraryReconciler::change_ids() const {
    std::set<long> ids;
    for (auto& p : changes_.new_parts) ids.insert(p.id);
    for (auto& p : changes_.modified_parts) ids.insert(p.id);
    return ids;
}

std::set<long> LibraryReconciler::new_part_ids() const {
    std::set<long> ids;
    for (auto& p : changes_.new_parts) ids.insert(p.id);
    return ids;
}

// ── compare ─────────────────────────────────────────────────────────

void LibraryReconciler::reset() {
    parts_.clear();
    part_templates_.clear();
    rendered_.clear();
    status_.clear();
    libraries_.clear();
    existing_.clear();
    changes_ = {};
    diagnostics_.clear();
    error_.clear();
    committed_files_.clear();
    stage_ = ReconcileStage::IDLE;
}

bool LibraryReconciler::compare(const std::vector<PartRecord>& parts) {
    reset();
    parts_ = parts;
    part_templates_.assign(parts_.size(), nullptr);
    rendered_.assign(parts_.size(), std::nullopt);
    status_.assign(parts_.size(), PartStatus::SKIPPED);
    log("Comparing " + std::to_string(parts_.size()) + " parts");

    group();
    if (!parse_existing()) return false;
    generate_desired();
    if (!classify()) return false;

    log("Found " + std::to_string(changes_.new_parts.size()) + " new, " +
        std::to_string(changes_.modified_parts.size()) + " modified");
    stage_ = changes_.empty() ? ReconcileStage::UP_TO_DATE : ReconcileStage::AWAITING_SELECTION;
    return true;
}

void LibraryReconciler::group() {
    for (size_t i = 0; i < parts_.size(); i++) {
        std::string category = parts_[i].category_path();
        const SymbolTemplate* tmpl = templates_.match(category);
        if (!tmpl) {
            diag(DiagnosticKind::UNMATCHED_CATEGORY, parts_[i].name,
                 "No template matches category '" + category + "', skipping");
            continue;
        }
        part_templates_[i] = tmpl;

        std::string name = library_name_for(category);
        auto& lib = libraries_[name];
        if (lib.name.empty()) {
            lib.name = name;
            lib.path = library_path(name);
        }
        lib.members.push_back(i);
    }
    log("Grouped parts into " + std::to_string(libraries_.size()) + " libraries");
}

bool LibraryReconciler::parse_existing() {
    LibraryParser parser(ParserOptions{opts_.verbose});
    for (auto& [name, lib] : libraries_) {
        size_t seen_warnings = parser.warnings().size();
        SymbolMap symbols;
        if (!parser.parse_file(lib.path, symbols)) {
            return fail(DiagnosticKind::IO_FAILURE, lib.path, "Cannot read library " + lib.path);
        }
        for (size_t w = seen_warnings; w < parser.warnings().size(); w++) {
            diagnostics_.push_back({DiagnosticKind::PARSE_WARNING, lib.path, parser.warnings()[w]});
        }
        existing_[name] = std::move(symbols);
    }
    return true;
}

void LibraryReconciler::generate_desired() {
    for (auto& [name, lib] : libraries_) {
        for (size_t i : lib.members) {
            try {
                rendered_[i] = renderer_.render(parts_[i], *part_templates_[i]);
            } catch (const std::exception& e) {
                status_[i] = PartStatus::FAILED;
                diag(DiagnosticKind::RENDER_FAILURE, parts_[i].name,
                     "Error generating symbol for part '" + parts_[i].name + "': " + e.what());
            }
        }
    }
}

bool LibraryReconciler::classify() {
    for (auto& [name, lib] : libraries_) {
        // Two parts collapsing onto one symbol name cannot be committed
        // without losing one of them
        std::map<std::string, size_t> owners;
        for (size_t i : lib.members) {
            if (!rendered_[i]) continue;
            auto [it, inserted] = owners.emplace(rendered_[i]->symbol_name, i);
            if (!inserted) {
                const PartRecord& first = parts_[it->second];
                return fail(DiagnosticKind::DUPLICATE_SYMBOL, lib.path,
                            "Symbol name '" + it->first + "' is produced by part " +
                            std::to_string(first.id) + " ('" + first.name + "') and part " +
                            std::to_string(parts_[i].id) + " ('" + parts_[i].name +
                            "') in " + lib.path);
            }
        }

        const SymbolMap& existing = existing_[name];
        for (size_t i : lib.members) {
            if (!rendered_[i]) continue;
            auto found = existing.find(rendered_[i]->symbol_name);
            if (found == existing.end()) {
                status_[i] = PartStatus::NEW;
                changes_.new_parts.push_back(parts_[i]);
            } else if (!symbols_equal(found->second, rendered_[i]->text)) {
                status_[i] = PartStatus::MODIFIED;
                changes_.modified_parts.push_back(parts_[i]);
            } else {
                status_[i] = PartStatus::UNCHANGED;
            }
        }
    }
    return true;
}

// ── commit ──────────────────────────────────────────────────────────

bool LibraryReconciler::commit(const std::set<long>& selected_ids) {
    if (stage_ == ReconcileStage::UP_TO_DATE) {
        log("All libraries are up-to-date, nothing to commit");
        return true;
    }
    if (stage_ != ReconcileStage::AWAITING_SELECTION) {
        error_ = "commit() called without a successful compare()";
        return false;
    }

    std::vector<bool> selected(parts_.size(), false);
    size_t selected_count = 0;
    for (size_t i = 0; i < parts_.size(); i++) {
        bool changed = status_[i] == PartStatus::NEW || status_[i] == PartStatus::MODIFIED;
        if (changed && selected_ids.count(parts_[i].id)) {
            selected[i] = true;
            selected_count++;
        }
    }
    log("Committing " + std::to_string(selected_count) + " selected changes");

    for (auto& [name, lib] : libraries_) {
        bool touched = false;
        for (size_t i : lib.members) touched = touched || selected[i];
        if (!touched) continue;

        const SymbolMap& existing = existing_[name];
        std::vector<std::string> blocks;
        std::set<std::string> written;
        for (size_t i : lib.members) {
            std::string symbol_name = rendered_[i] ? rendered_[i]->symbol_name
                                                   : SymbolRenderer::symbol_name_for(parts_[i]);
            if (written.count(symbol_name)) continue;

            if (selected[i]) {
                blocks.push_back(rendered_[i]->text);
            } else {
                // Unselected parts keep exactly what was there before; parts
                // that did not exist yet stay out
                auto found = existing.find(symbol_name);
                if (found == existing.end()) continue;
                blocks.push_back(found->second);
            }
            written.insert(symbol_name);
        }

        if (!write_library(lib, library_text(blocks))) return false;
        committed_files_.push_back(lib.path);
        log("Wrote " + std::to_string(blocks.size()) + " symbols to " + lib.path);
    }

    stage_ = ReconcileStage::COMMITTED;
    return true;
}

// Write to a temporary file beside the target, then rename over it so a
// failed write never leaves a truncated library behind.
bool LibraryReconciler::write_library(const LibraryFile& lib, const std::string& content) {
    std::error_code ec;
    fs::create_directories(opts_.output_dir, ec);
    if (ec) {
        return fail(DiagnosticKind::IO_FAILURE, opts_.output_dir,
                    "Cannot create output directory " + opts_.output_dir + ": " + ec.message());
    }

    std::string tmp_path = lib.path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return fail(DiagnosticKind::IO_FAILURE, lib.path, "Cannot open " + tmp_path + " for writing");
        }
        out << content;
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(tmp_path, ec);
            return fail(DiagnosticKind::IO_FAILURE, lib.path, "Failed writing " + tmp_path);
        }
    }

    fs::rename(tmp_path, lib.path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        return fail(DiagnosticKind::IO_FAILURE, lib.path,
                    "Cannot replace " + lib.path + ": " + ec.message());
    }
    return true;
}

bool LibraryReconciler::fail(DiagnosticKind kind, const std::string& subject,
                             const std::string& msg) {
    diag(kind, subject, msg);
    error_ = msg;
    stage_ = ReconcileStage::FAILED;
    return false;
}

// --- Logging ---

void LibraryReconciler::diag(DiagnosticKind kind, const std::string& subject,
                             const std::string& msg) {
    diagnostics_.push_back({kind, subject, msg});
    std::cerr << "[WARNING] " << msg << std::endl;
}

void LibraryReconciler::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cout << "[reconcile] " << msg << std::endl;
    }
}

} // namespace partdb2kicad
