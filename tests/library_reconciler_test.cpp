#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include "library_reconciler.h"
#include "library_parser.h"
#include "symbol_diff.h"

namespace partdb2kicad {

namespace fs = std::filesystem;

static std::string slurp(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static PartRecord make_part(long id, const std::string& name, const std::string& category,
                            const std::string& description) {
  PartRecord p;
  p.id = id;
  p.name = name;
  p.has_category = true;
  p.category.full_path = category;
  p.attributes["description"] = description;
  return p;
}

class LibraryReconcilerTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = fs::temp_directory_path() / (std::string("partdb2kicad_") + info->name());
    fs::remove_all(dir_);
    opts_.output_dir = dir_.string();

    SymbolTemplate opamps;
    opamps.name = "OpAmps";
    opamps.applies_to_categories = {"OpAmp"};
    opamps.generator = GeneratorKind::IC_BOX;
    opamps.power_pin_names = {"VCC", "GND"};
    opamps.field_mapping = {{"Reference", "U", true},
                            {"Value", "name", false},
                            {"Description", "description", false}};
    templates_.add(opamps);

    SymbolTemplate headers;
    headers.name = "Headers";
    headers.applies_to_categories = {"Pin Headers"};
    headers.generator = GeneratorKind::CONNECTOR;
    headers.field_mapping = {{"Reference", "J", true}};
    templates_.add(headers);

    PartRecord lm358 = make_part(1, "LM358", "Active → ICs → OpAmp", "Dual op-amp");
    lm358.parameters = {{"Pin Description", "OUT1,IN1-,IN1+,GND,IN2+,IN2-,OUT2,VCC"}};
    PartRecord tl072 = make_part(2, "TL072", "Active → ICs → OpAmp", "JFET op-amp");
    tl072.parameters = {{"Pin Description", "OUT1,IN1-,IN1+,V-,IN2+,IN2-,OUT2,V+"}};
    PartRecord header = make_part(3, "Header 1x4", "Connectors → Pin Headers", "Pin header");
    header.parameters = {{"Number of Pins", "4"}, {"Gender", "male"}};
    parts_ = {lm358, tl072, header};
  }

  void TearDown() override { fs::remove_all(dir_); }

  // Run a full compare + commit of every change
  void commit_all(const std::vector<PartRecord>& parts) {
    LibraryReconciler r(templates_, opts_);
    ASSERT_TRUE(r.compare(parts));
    ASSERT_TRUE(r.commit(r.change_ids()));
  }

  fs::path lib(const std::string& name) const { return dir_ / (name + ".kicad_sym"); }

  fs::path dir_;
  ReconcilerOptions opts_;
  TemplateSet templates_;
  std::vector<PartRecord> parts_;
};

TEST_F(LibraryReconcilerTest, FirstRunCreatesLibraries) {
  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  EXPECT_EQ(r.stage(), ReconcileStage::AWAITING_SELECTION);
  EXPECT_EQ(r.changes().new_parts.size(), 3u);
  EXPECT_TRUE(r.changes().modified_parts.empty());
  ASSERT_EQ(r.libraries().size(), 2u);

  ASSERT_TRUE(r.commit(r.change_ids()));
  EXPECT_EQ(r.stage(), ReconcileStage::COMMITTED);
  EXPECT_EQ(r.committed_files().size(), 2u);

  std::string text = slurp(lib("OpAmp"));
  EXPECT_EQ(text.rfind("(kicad_symbol_lib (version 20211014) (generator partdb_linker)\n", 0), 0u);
  EXPECT_EQ(text.substr(text.size() - 2), ")\n");
  EXPECT_TRUE(fs::exists(lib("Pin_Headers")));
  EXPECT_FALSE(fs::exists(lib("OpAmp").string() + ".tmp"));
}

TEST_F(LibraryReconcilerTest, RoundTrip) {
  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  ASSERT_TRUE(r.commit(r.change_ids()));

  SymbolRenderer renderer;
  LibraryParser parser;
  SymbolMap symbols = parser.parse(slurp(lib("OpAmp")));
  ASSERT_EQ(symbols.size(), 2u);
  EXPECT_TRUE(symbols_equal(symbols["LM358"], renderer.render(parts_[0], templates_.templates()[0]).text));
  EXPECT_TRUE(symbols_equal(symbols["TL072"], renderer.render(parts_[1], templates_.templates()[0]).text));
  EXPECT_TRUE(parser.warnings().empty());
}

TEST_F(LibraryReconcilerTest, SecondRunIsUpToDate) {
  commit_all(parts_);
  std::string before = slurp(lib("OpAmp"));

  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  EXPECT_EQ(r.stage(), ReconcileStage::UP_TO_DATE);
  EXPECT_TRUE(r.changes().empty());
  EXPECT_TRUE(r.commit({}));
  EXPECT_TRUE(r.committed_files().empty());
  EXPECT_EQ(slurp(lib("OpAmp")), before);
}

TEST_F(LibraryReconcilerTest, ZeroSelectedLeavesFileByteIdentical) {
  commit_all(parts_);
  std::string before = slurp(lib("OpAmp"));

  parts_[0].attributes["description"] = "Dual op-amp, low power";
  parts_[1].attributes["description"] = "Low-noise JFET op-amp";
  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  ASSERT_EQ(r.changes().modified_parts.size(), 2u);
  EXPECT_TRUE(r.changes().new_parts.empty());

  ASSERT_TRUE(r.commit({}));
  EXPECT_TRUE(r.committed_files().empty());
  EXPECT_EQ(slurp(lib("OpAmp")), before);
}

TEST_F(LibraryReconcilerTest, UnselectedModifiedKeepsPriorBlock) {
  commit_all(parts_);
  LibraryParser parser;
  SymbolMap before = parser.parse(slurp(lib("OpAmp")));

  parts_[0].attributes["description"] = "Dual op-amp, low power";
  parts_[1].attributes["description"] = "Low-noise JFET op-amp";
  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  ASSERT_TRUE(r.commit({1}));

  SymbolMap after = parser.parse(slurp(lib("OpAmp")));
  ASSERT_EQ(after.size(), 2u);
  EXPECT_NE(after["LM358"].find("low power"), std::string::npos);
  EXPECT_EQ(after["TL072"], before["TL072"]);
  // The header library had no selected part
  EXPECT_EQ(r.committed_files().size(), 1u);
}

TEST_F(LibraryReconcilerTest, NewUnselectedPartsAreOmitted) {
  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  ASSERT_TRUE(r.commit({2}));

  LibraryParser parser;
  SymbolMap symbols = parser.parse(slurp(lib("OpAmp")));
  ASSERT_EQ(symbols.size(), 1u);
  EXPECT_EQ(symbols.count("TL072"), 1u);
  EXPECT_FALSE(fs::exists(lib("Pin_Headers")));
}

TEST_F(LibraryReconcilerTest, VanishedPartsAreDropped) {
  commit_all(parts_);
  std::vector<PartRecord> fewer = {parts_[0], parts_[2]};
  fewer[0].attributes["description"] = "changed";
  commit_all(fewer);

  LibraryParser parser;
  SymbolMap symbols = parser.parse(slurp(lib("OpAmp")));
  ASSERT_EQ(symbols.size(), 1u);
  EXPECT_EQ(symbols.count("LM358"), 1u);
}

TEST_F(LibraryReconcilerTest, UnmatchedCategoryIsSkipped) {
  parts_.push_back(make_part(4, "R 10k", "Passives → Resistors", "Resistor"));
  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  EXPECT_EQ(r.changes().new_parts.size(), 3u);
  ASSERT_EQ(r.diagnostics().size(), 1u);
  EXPECT_EQ(r.diagnostics()[0].kind, DiagnosticKind::UNMATCHED_CATEGORY);
  EXPECT_EQ(r.diagnostics()[0].subject, "R 10k");
  EXPECT_EQ(r.libraries().count("Resistors"), 0u);
}

TEST_F(LibraryReconcilerTest, DuplicateSymbolNameFails) {
  parts_.push_back(make_part(5, "LM358", "Active → ICs → OpAmp", "Second copy"));
  LibraryReconciler r(templates_, opts_);
  EXPECT_FALSE(r.compare(parts_));
  EXPECT_EQ(r.stage(), ReconcileStage::FAILED);
  EXPECT_NE(r.error().find("LM358"), std::string::npos);
  ASSERT_FALSE(r.diagnostics().empty());
  EXPECT_EQ(r.diagnostics().back().kind, DiagnosticKind::DUPLICATE_SYMBOL);
  EXPECT_FALSE(r.commit({1}));
  EXPECT_FALSE(fs::exists(dir_));
}

TEST_F(LibraryReconcilerTest, NamesCollapsingOnUnderscoreAreDuplicates) {
  parts_.push_back(make_part(6, "Header_1x4", "Connectors → Pin Headers", "Same name"));
  LibraryReconciler r(templates_, opts_);
  EXPECT_FALSE(r.compare(parts_));
  EXPECT_NE(r.error().find("Header_1x4"), std::string::npos);
}

TEST_F(LibraryReconcilerTest, RenderFailureIsIsolated) {
  parts_.push_back(make_part(7, "", "Active → ICs → OpAmp", "No name"));
  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  EXPECT_EQ(r.changes().new_parts.size(), 3u);
  ASSERT_EQ(r.diagnostics().size(), 1u);
  EXPECT_EQ(r.diagnostics()[0].kind, DiagnosticKind::RENDER_FAILURE);
  ASSERT_TRUE(r.commit(r.change_ids()));
}

TEST_F(LibraryReconcilerTest, CreatesNestedOutputDirectory) {
  opts_.output_dir = (dir_ / "nested" / "libs").string();
  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  ASSERT_TRUE(r.commit(r.change_ids()));
  EXPECT_TRUE(fs::exists(dir_ / "nested" / "libs" / "OpAmp.kicad_sym"));
}

TEST_F(LibraryReconcilerTest, HandEditedBlockIsModified) {
  commit_all(parts_);
  std::string text = slurp(lib("OpAmp"));
  auto pos = text.find("JFET op-amp");
  ASSERT_NE(pos, std::string::npos);
  text.replace(pos, 4, "MOS");
  {
    std::ofstream out(lib("OpAmp"), std::ios::binary | std::ios::trunc);
    out << text;
  }

  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  ASSERT_EQ(r.changes().modified_parts.size(), 1u);
  EXPECT_EQ(r.changes().modified_parts[0].id, 2);
}

TEST_F(LibraryReconcilerTest, QuotedPartNameIsStable) {
  PartRecord jack = make_part(10, "Jack 6\"", "Connectors → Pin Headers", "Audio jack");
  jack.parameters = {{"Number of Pins", "3"}};
  std::vector<PartRecord> parts = {jack, parts_[2]};
  commit_all(parts);
  EXPECT_NE(slurp(lib("Pin_Headers")).find("(symbol \"Jack_6\\\"\""), std::string::npos);

  LibraryReconciler again(templates_, opts_);
  ASSERT_TRUE(again.compare(parts));
  EXPECT_EQ(again.stage(), ReconcileStage::UP_TO_DATE);
  EXPECT_TRUE(again.changes().new_parts.empty());
  EXPECT_TRUE(again.diagnostics().empty());
}

TEST_F(LibraryReconcilerTest, QuotedPartNameSurvivesSiblingCommit) {
  PartRecord jack = make_part(10, "Jack 6\"", "Connectors → Pin Headers", "Audio jack");
  jack.parameters = {{"Number of Pins", "3"}};
  std::vector<PartRecord> parts = {jack, parts_[2]};
  commit_all(parts);
  LibraryParser parser;
  SymbolMap before = parser.parse(slurp(lib("Pin_Headers")));
  ASSERT_EQ(before.count("Jack_6\""), 1u);

  parts[1].parameters = {{"Number of Pins", "4"}, {"Gender", "female"}};
  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts));
  ASSERT_EQ(r.changes().modified_parts.size(), 1u);
  EXPECT_EQ(r.changes().modified_parts[0].id, 3);
  EXPECT_TRUE(r.changes().new_parts.empty());
  ASSERT_TRUE(r.commit({3}));

  SymbolMap after = parser.parse(slurp(lib("Pin_Headers")));
  ASSERT_EQ(after.size(), 2u);
  EXPECT_EQ(after["Jack_6\""], before["Jack_6\""]);
}

TEST_F(LibraryReconcilerTest, TrailingBackslashValueIsStable) {
  parts_[0].attributes["description"] = "path C:\\";
  commit_all(parts_);
  EXPECT_NE(slurp(lib("OpAmp")).find("\"path C:\\\\\""), std::string::npos);

  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  EXPECT_EQ(r.stage(), ReconcileStage::UP_TO_DATE);
  EXPECT_TRUE(r.changes().empty());
  EXPECT_TRUE(r.diagnostics().empty());
}

TEST_F(LibraryReconcilerTest, UnreadableLibraryFailsCompare) {
  fs::create_directories(lib("OpAmp"));
  LibraryReconciler r(templates_, opts_);
  EXPECT_FALSE(r.compare(parts_));
  EXPECT_EQ(r.stage(), ReconcileStage::FAILED);
  ASSERT_FALSE(r.diagnostics().empty());
  EXPECT_EQ(r.diagnostics().back().kind, DiagnosticKind::IO_FAILURE);
  EXPECT_EQ(r.diagnostics().back().subject, lib("OpAmp").string());
  EXPECT_FALSE(r.commit({1}));
}

TEST_F(LibraryReconcilerTest, FailedRenameLeavesNoTempFile) {
  commit_all(parts_);
  parts_[2].parameters = {{"Number of Pins", "4"}, {"Gender", "female"}};
  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));

  // A directory now sits where the library file goes
  fs::remove(lib("Pin_Headers"));
  fs::create_directories(lib("Pin_Headers") / "keep");
  EXPECT_FALSE(r.commit({3}));
  EXPECT_EQ(r.stage(), ReconcileStage::FAILED);
  ASSERT_FALSE(r.diagnostics().empty());
  EXPECT_EQ(r.diagnostics().back().kind, DiagnosticKind::IO_FAILURE);
  EXPECT_TRUE(fs::is_directory(lib("Pin_Headers") / "keep"));
  EXPECT_FALSE(fs::exists(lib("Pin_Headers").string() + ".tmp"));
}

TEST_F(LibraryReconcilerTest, FailedTempWriteLeavesLibraryUnchanged) {
  commit_all(parts_);
  std::string before = slurp(lib("OpAmp"));
  parts_[0].attributes["description"] = "Dual op-amp, low power";
  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));

  fs::create_directories(lib("OpAmp").string() + ".tmp");
  EXPECT_FALSE(r.commit({1}));
  ASSERT_FALSE(r.diagnostics().empty());
  EXPECT_EQ(r.diagnostics().back().kind, DiagnosticKind::IO_FAILURE);
  EXPECT_EQ(slurp(lib("OpAmp")), before);
}

TEST_F(LibraryReconcilerTest, OutputDirectoryBlockedByFile) {
  fs::create_directories(dir_);
  fs::path blocker = dir_ / "libs";
  {
    std::ofstream out(blocker, std::ios::binary);
    out << "not a directory";
  }
  opts_.output_dir = blocker.string();
  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  EXPECT_FALSE(r.commit(r.change_ids()));
  ASSERT_FALSE(r.diagnostics().empty());
  EXPECT_EQ(r.diagnostics().back().kind, DiagnosticKind::IO_FAILURE);
  EXPECT_EQ(slurp(blocker), "not a directory");
  EXPECT_TRUE(r.committed_files().empty());
}

TEST_F(LibraryReconcilerTest, UnterminatedBlockIsNewWithWarning) {
  commit_all(parts_);
  std::string text = slurp(lib("OpAmp"));
  auto pos = text.find("  (symbol \"TL072\"");
  ASSERT_NE(pos, std::string::npos);
  text = text.substr(0, pos) + "  (symbol \"TL072\" (in_bom yes\n)\n";
  {
    std::ofstream out(lib("OpAmp"), std::ios::binary | std::ios::trunc);
    out << text;
  }

  LibraryReconciler r(templates_, opts_);
  ASSERT_TRUE(r.compare(parts_));
  ASSERT_EQ(r.changes().new_parts.size(), 1u);
  EXPECT_EQ(r.changes().new_parts[0].id, 2);
  EXPECT_TRUE(r.changes().modified_parts.empty());
  ASSERT_EQ(r.diagnostics().size(), 1u);
  EXPECT_EQ(r.diagnostics()[0].kind, DiagnosticKind::PARSE_WARNING);
  EXPECT_EQ(r.diagnostics()[0].subject, lib("OpAmp").string());
  EXPECT_NE(r.diagnostics()[0].message.find("TL072"), std::string::npos);
}

TEST_F(LibraryReconcilerTest, CommitWithoutCompareFails) {
  LibraryReconciler r(templates_, opts_);
  EXPECT_FALSE(r.commit({1}));
  EXPECT_FALSE(r.error().empty());
}

TEST(LibraryNameTest, LastCategorySegment) {
  EXPECT_EQ(LibraryReconciler::library_name_for("Active → ICs → OpAmp"), "OpAmp");
  EXPECT_EQ(LibraryReconciler::library_name_for("Connectors → Pin Headers"), "Pin_Headers");
  EXPECT_EQ(LibraryReconciler::library_name_for("ICs → Op Amp/Comparator "), "Op_Amp_Comparator");
  EXPECT_EQ(LibraryReconciler::library_name_for("Resistors"), "Resistors");
}

TEST(LibraryTextTest, Layout) {
  TemplateSet templates;
  ReconcilerOptions opts;
  opts.library_version = "20231120";
  opts.generator = "test_gen";
  LibraryReconciler r(templates, opts);
  EXPECT_EQ(r.library_text({"  (symbol \"A\")", "  (symbol \"B\")"}),
            "(kicad_symbol_lib (version 20231120) (generator test_gen)\n"
            "  (symbol \"A\")\n"
            "  (symbol \"B\")\n"
            ")\n");
}

} // namespace partdb2kicad
