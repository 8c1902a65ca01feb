// =============================================================================
// Pipeline / View Extractor and Registry Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lineage/extract/extractor.hpp"
#include "lineage/extract/pipeline_extractor.hpp"
#include "lineage/extract/view_extractor.hpp"

using namespace lineage;

namespace {

const char* kReportJob =
    "#########################################################################################\n"
    "# Date           : 16/10/2018\n"
    "# Purpose        : Spark job for generating A2 report tables.\n"
    "#########################################################################################\n"
    "# Input tables:\n"
    "#   rpt_udp.rpt_non_financials\n"
    "#   rpt_udp.ref_branch_code_ctd\n"
    "# Output table(s):\n"
    "#   RPT_UDP.rpt_assessment_clubs_association (append)\n"
    "#   rpt_udp.rpt_assessment_clubs_association_aggr (append)\n"
    "#########################################################################################\n"
    "\n"
    "import sys\n"
    "branch_ref = spark.table('rpt_udp.ref_branch_code_ctd').select('x')\n"
    "df = spark.table(\"RPT_UDP.rpt_non_financials\").filter(col('y') > 1)\n"
    "cols = spark.table(trans_target).columns\n"
    "df.write.insertInto('rpt_udp.rpt_trans_log', overwrite=True)\n";

} // namespace

// =============================================================================
// Pipeline scripts
// =============================================================================

class PipelineExtractorTest : public ::testing::Test {
protected:
    PipelineExtractor extractor_;
};

TEST_F(PipelineExtractorTest, HeaderOutputsAndInsertTargets) {
    TableSet written = extractor_.written_tables(kReportJob);
    TableSet expected = {
        "rpt_udp.rpt_assessment_clubs_association",
        "rpt_udp.rpt_assessment_clubs_association_aggr",
        "rpt_udp.rpt_trans_log",
    };
    EXPECT_EQ(written, expected);
}

TEST_F(PipelineExtractorTest, InputSectionIsNotAnOutput) {
    TableSet written = extractor_.written_tables(kReportJob);
    EXPECT_EQ(written.count("rpt_udp.rpt_non_financials"), 0u);
    EXPECT_EQ(written.count("rpt_udp.ref_branch_code_ctd"), 0u);
}

TEST_F(PipelineExtractorTest, ReadsOnlyLiteralSparkTableCalls) {
    TableSet read = extractor_.read_tables(kReportJob);
    TableSet expected = {"rpt_udp.ref_branch_code_ctd", "rpt_udp.rpt_non_financials"};
    EXPECT_EQ(read, expected);
}

TEST_F(PipelineExtractorTest, OutputSectionEndsAtNextLabel) {
    const char* text =
        "# Output tables:\n"
        "#   db.out_a,\n"
        "#   db.out_b\n"
        "# Revision: 2\n"
        "#   db.not_an_output\n"
        "x = 1\n";
    TableSet expected = {"db.out_a", "db.out_b"};
    EXPECT_EQ(parse_output_header(text), expected);
}

TEST_F(PipelineExtractorTest, OutputsAfterCodeAreIgnored) {
    const char* text =
        "import sys\n"
        "# Output table(s):\n"
        "#   db.late\n";
    EXPECT_TRUE(parse_output_header(text).empty());
}

TEST_F(PipelineExtractorTest, OutputsOnHeaderLine) {
    const char* text = "// Output tables: db.one, db.two\n";
    TableSet expected = {"db.one", "db.two"};
    EXPECT_EQ(parse_output_header(text), expected);
}

TEST_F(PipelineExtractorTest, InvisibleCharactersInHeader) {
    std::string text = "\xEF\xBB\xBF# Output table(s):\n#\xC2\xA0\xC2\xA0 db.spaced\n";
    TableSet expected = {"db.spaced"};
    EXPECT_EQ(parse_output_header(text), expected);
}

TEST_F(PipelineExtractorTest, SaveAsTableIsAWrite) {
    TableSet expected = {"mart.daily"};
    EXPECT_EQ(parse_insert_targets("df.write.mode('overwrite').saveAsTable('mart.daily')\n"), expected);
}

TEST_F(PipelineExtractorTest, EmptyTextYieldsNothing) {
    EXPECT_TRUE(extractor_.written_tables("").empty());
    EXPECT_TRUE(extractor_.read_tables("").empty());
}

// =============================================================================
// View definitions
// =============================================================================

class ViewExtractorTest : public ::testing::Test {
protected:
    ViewExtractor extractor_;
};

TEST_F(ViewExtractorTest, QualifiedViewIsWritten) {
    const char* ddl =
        "--Purpose : DDL for creating view ads_public.ct_complex\n"
        "CREATE OR REPLACE VIEW ADS_PUBLIC.ct_complex AS\n"
        "SELECT a.x FROM udp_src.ct_base a\n"
        "LEFT JOIN udp_src.ct_codes c ON a.k = c.k\n";

    TableSet written = extractor_.written_tables(ddl);
    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(*written.begin(), "ads_public.ct_complex");

    TableSet expected = {"udp_src.ct_base", "udp_src.ct_codes"};
    EXPECT_EQ(extractor_.read_tables(ddl), expected);
}

TEST_F(ViewExtractorTest, BareViewIsNotIndexedButDeclared) {
    const char* ddl = "create view ct_local as select * from udp_src.ct_base;\n";
    EXPECT_TRUE(extractor_.written_tables(ddl).empty());

    TableSet declared = extractor_.declared_targets(ddl);
    ASSERT_EQ(declared.size(), 1u);
    EXPECT_EQ(*declared.begin(), "ct_local");
}

TEST_F(ViewExtractorTest, UnqualifiedReadsAreIgnored) {
    const char* ddl = "create view db.v as select * from base_table join db.other on 1=1";
    TableSet expected = {"db.other"};
    EXPECT_EQ(extractor_.read_tables(ddl), expected);
}

// =============================================================================
// Registry
// =============================================================================

class ExtractorRegistryTest : public ::testing::Test {
protected:
    ExtractorRegistry registry_ = ExtractorRegistry::with_default_dialects();
};

TEST_F(ExtractorRegistryTest, DefaultDialects) {
    auto py = registry_.for_extension(".py");
    ASSERT_EQ(py.size(), 1u);
    EXPECT_EQ(py[0]->kind(), WriterKind::PipelineScript);

    auto sql = registry_.for_extension("SQL");
    ASSERT_EQ(sql.size(), 2u);
    EXPECT_EQ(sql[0]->kind(), WriterKind::PipelineScript);
    EXPECT_EQ(sql[1]->kind(), WriterKind::ViewDefinition);

    auto sas = registry_.for_file("jobs/LOAD.SAS");
    ASSERT_EQ(sas.size(), 1u);
    EXPECT_EQ(sas[0]->kind(), WriterKind::SasProgram);

    EXPECT_TRUE(registry_.for_extension(".txt").empty());
}

TEST_F(ExtractorRegistryTest, KindLookup) {
    for (auto kind : {WriterKind::PipelineScript, WriterKind::ViewDefinition, WriterKind::SasProgram}) {
        const TableExtractor* extractor = registry_.for_kind(kind);
        ASSERT_NE(extractor, nullptr);
        EXPECT_EQ(extractor->kind(), kind);
    }
}

TEST_F(ExtractorRegistryTest, ExtensionsAreSorted) {
    std::vector<std::string> expected = {".py", ".sas", ".sql"};
    EXPECT_EQ(registry_.extensions(), expected);
}
