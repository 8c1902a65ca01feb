// =============================================================================
// Table Name Canonicalization Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lineage/table_name.hpp"

using namespace lineage;

class TableNameTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// =============================================================================
// Qualified names
// =============================================================================

TEST_F(TableNameTest, QualifiedNamesAreLowerCased) {
    EXPECT_EQ(canonical_table_name("UDP_SRC.Customer"), "udp_src.customer");
    EXPECT_EQ(canonical_table_name("  rpt_udp.RPT_X  "), "rpt_udp.rpt_x");
}

TEST_F(TableNameTest, DatasetOptionsAreStripped) {
    EXPECT_EQ(canonical_table_name("lib.tbl(drop=x keep=y)"), "lib.tbl");
    EXPECT_EQ(canonical_table_name("work.tmp / view=work.tmp_v"), "work.tmp");
    EXPECT_EQ(canonical_table_name("ads_stg.final;"), "ads_stg.final");
    EXPECT_EQ(canonical_table_name("ads_stg.final,"), "ads_stg.final");
}

TEST_F(TableNameTest, QuotesAndTrailingDotsAreStripped) {
    EXPECT_EQ(canonical_table_name("'db.t'"), "db.t");
    EXPECT_EQ(canonical_table_name("\"db.t\""), "db.t");
    EXPECT_EQ(canonical_table_name("staging."), "staging");
}

TEST_F(TableNameTest, MoreThanTwoPartsIsRejected) {
    EXPECT_FALSE(canonical_table_name("a.b.c").has_value());
}

// =============================================================================
// Rejected tokens
// =============================================================================

TEST_F(TableNameTest, UnresolvedMacrosAreRejected) {
    EXPECT_FALSE(canonical_table_name("&lib..tbl").has_value());
    EXPECT_FALSE(canonical_table_name("%sysfunc(x)").has_value());
}

TEST_F(TableNameTest, NullDatasetIsRejected) {
    EXPECT_FALSE(canonical_table_name("_NULL_").has_value());
    EXPECT_FALSE(canonical_table_name("_null_").has_value());
}

TEST_F(TableNameTest, KeywordsNumbersAndLettersAreRejected) {
    EXPECT_FALSE(canonical_table_name("select").has_value());
    EXPECT_FALSE(canonical_table_name("WHERE").has_value());
    EXPECT_FALSE(canonical_table_name("123").has_value());
    EXPECT_FALSE(canonical_table_name("x").has_value());
    EXPECT_FALSE(canonical_table_name("").has_value());
    EXPECT_FALSE(canonical_table_name("   ").has_value());
}

TEST_F(TableNameTest, BareNamesStayBare) {
    EXPECT_EQ(canonical_table_name("Customer_Base"), "customer_base");
}

// =============================================================================
// Helpers
// =============================================================================

TEST_F(TableNameTest, NormalizeNameOnlyTrimsAndLowers) {
    EXPECT_EQ(normalize_name("  Rpt.X "), "rpt.x");
    EXPECT_EQ(normalize_name("select"), "select");
}

TEST_F(TableNameTest, SchemaAndTableParts) {
    EXPECT_TRUE(is_qualified("db.t"));
    EXPECT_FALSE(is_qualified("t"));
    EXPECT_EQ(table_part("db.t"), "t");
    EXPECT_EQ(table_part("t"), "t");
    EXPECT_EQ(schema_part("db.t"), "db");
    EXPECT_EQ(schema_part("t"), "");
    EXPECT_EQ(to_fqtn("DB", "Tbl"), "db.tbl");
}

TEST_F(TableNameTest, ReservedWords) {
    EXPECT_TRUE(is_reserved_word("from"));
    EXPECT_TRUE(is_reserved_word("noprint"));
    EXPECT_FALSE(is_reserved_word("customers"));
}
