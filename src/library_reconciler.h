#pragma once

#include "part_model.h"
#include "template_config.h"
#include "symbol_renderer.h"
#include "library_parser.h"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace partdb2kicad {

struct ReconcilerOptions {
    std::string output_dir = "kicad_libs";
    std::string library_extension = ".kicad_sym";
    std::string library_version = "20211014";
    std::string generator = "partdb_linker";
    bool verbose = false;
};

enum class DiagnosticKind {
    UNMATCHED_CATEGORY,
    RENDER_FAILURE,
    PARSE_WARNING,
    DUPLICATE_SYMBOL,
    IO_FAILURE
};

struct Diagnostic {
    DiagnosticKind kind;
    std::string subject;   // part name or library path
    std::string message;
};

std::string diagnostic_kind_str(DiagnosticKind kind);

// One output library: every matched part whose category tail maps to it
struct LibraryFile {
    std::string name;               // e.g. "OpAmp"
    std::string path;               // <output_dir>/OpAmp.kicad_sym
    std::vector<size_t> members;    // indices into the fetched parts, input order
};

enum class ReconcileStage {
    IDLE,
    AWAITING_SELECTION,  // CLASSIFY found changes
    UP_TO_DATE,          // CLASSIFY found nothing to do
    COMMITTED,
    FAILED
};

// Rebuilds .kicad_sym libraries from part records, touching only what
// changed.
//
//   compare(): GROUP -> PARSE_EXISTING -> GENERATE_DESIRED -> CLASSIFY
//   commit():  rewrite every library holding at least one selected part
//
// Per-part problems become diagnostics. Run-level problems (I/O, duplicate
// symbol names) make compare()/commit() return false with error() set.
// Two runs must not target the same output directory at the same time.
class LibraryReconciler {
public:
    LibraryReconciler(const TemplateSet& templates, const ReconcilerOptions& opts = {});

    // Classify the fetched parts against the libraries on disk.
    bool compare(const std::vector<PartRecord>& parts);

    // Commit the selected part ids (a subset of the new/modified parts).
    // Libraries without a selected part are left untouched.
    bool commit(const std::set<long>& selected_ids);

    const ChangeSet& changes() const { return changes_; }
    ReconcileStage stage() const { return stage_; }
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    const std::string& error() const { return error_; }
    const std::vector<std::string>& committed_files() const { return committed_files_; }
    const std::map<std::string, LibraryFile>& libraries() const { return libraries_; }

    // Ids of every new and modified part
    std::set<long> change_ids() const;
    std::set<long> new_part_ids() const;

    // Library file name for a category path: last "→" segment, spaces and
    // slashes replaced by underscores.
    static std::string library_name_for(const std::string& category_path);
    std::string library_path(const std::string& library_name) const;

    // Assemble the full file text around the given blocks
    std::string library_text(const std::vector<std::string>& blocks) const;

private:
    enum class PartStatus { SKIPPED, FAILED, UNCHANGED, NEW, MODIFIED };

    const TemplateSet& templates_;
    ReconcilerOptions opts_;
    SymbolRenderer renderer_;

    std::vector<PartRecord> parts_;
    std::vector<const SymbolTemplate*> part_templates_;
    std::vector<std::optional<SymbolBlock>> rendered_;
    std::vector<PartStatus> status_;
    std::map<std::string, LibraryFile> libraries_;
    std::map<std::string, SymbolMap> existing_;   // parsed once per run

    ChangeSet changes_;
    ReconcileStage stage_ = ReconcileStage::IDLE;
    std::vector<Diagnostic> diagnostics_;
    std::string error_;
    std::vector<std::string> committed_files_;

    void reset();
    void group();
    bool parse_existing();
    void generate_desired();
    bool classify();

    bool write_library(const LibraryFile& lib, const std::string& content);
    bool fail(DiagnosticKind kind, const std::string& subject, const std::string& msg);

    void diag(DiagnosticKind kind, const std::string& subject, const std::string& msg);
    void log(const std::string& msg);
};

} // namespace partdb2kicad
