// =============================================================================
// Row Shaping Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lineage/row_shaper.hpp"

#include <stdexcept>

using namespace lineage;

class RowShaperTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(RowShaperTest, SingleTablePathIsItsOwnSource) {
    auto rows = shape_rows("db.t", {{"db.t"}});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].target, "db.t");
    EXPECT_TRUE(rows[0].layers.empty());
    EXPECT_EQ(rows[0].source, "db.t");
}

TEST_F(RowShaperTest, TwoTablePathHasNoLayers) {
    auto rows = shape_rows("db.t", {{"db.t", "db.src"}});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_TRUE(rows[0].layers.empty());
    EXPECT_EQ(rows[0].source, "db.src");
}

TEST_F(RowShaperTest, InnerTablesBecomeLayers) {
    auto rows = shape_rows("db.t", {{"db.t", "db.l1", "db.l2", "db.src"}, {"db.t", "db.other"}});
    ASSERT_EQ(rows.size(), 2u);

    std::vector<std::string> layers = {"db.l1", "db.l2"};
    EXPECT_EQ(rows[0].layers, layers);
    EXPECT_EQ(rows[0].source, "db.src");
    EXPECT_EQ(rows[1].source, "db.other");
}

TEST_F(RowShaperTest, EmptyPathsAreSkipped) {
    auto rows = shape_rows("db.t", {{}, {"db.t", "db.src"}});
    EXPECT_EQ(rows.size(), 1u);
    EXPECT_TRUE(shape_rows("db.t", {}).empty());
}

TEST_F(RowShaperTest, TableWidthFollowsWidestRow) {
    LineageTable table;
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.layer_count(), 0u);

    table.append(shape_rows("db.t", {{"db.t", "db.src"}}));
    table.append(shape_rows("db.u", {{"db.u", "db.a", "db.b", "db.c", "db.src"}}));

    EXPECT_EQ(table.size(), 2u);
    EXPECT_EQ(table.layer_count(), 3u);

    std::vector<std::string> columns = {"Target Table", "Layer 1", "Layer 2", "Layer 3", "Source Table"};
    EXPECT_EQ(table.column_names(), columns);
}

TEST_F(RowShaperTest, ShortRowsLeaveLayersUnset) {
    LineageTable table;
    table.append(LineageRow{"db.t", {"db.a"}, "db.src"});
    table.append(LineageRow{"db.u", {"db.a", "db.b"}, "db.src"});

    auto first = table.record(0);
    ASSERT_EQ(first.size(), 4u);
    EXPECT_EQ(first[0], "db.t");
    EXPECT_EQ(first[1], "db.a");
    EXPECT_FALSE(first[2].has_value());
    EXPECT_EQ(first[3], "db.src");

    auto second = table.record(1);
    EXPECT_EQ(second[2], "db.b");
    EXPECT_THROW(table.record(2), std::out_of_range);
}

TEST_F(RowShaperTest, NoLayerColumnsWhenAllPathsAreShort) {
    LineageTable table;
    table.append(LineageRow{"db.t", {}, "db.t"});

    std::vector<std::string> columns = {"Target Table", "Source Table"};
    EXPECT_EQ(table.column_names(), columns);
    EXPECT_EQ(table.record(0).size(), 2u);
}
