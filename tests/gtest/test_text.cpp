// =============================================================================
// Text and UTF-8 Helper Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lineage/util/text.hpp"
#include "lineage/util/utf8.hpp"

#include <filesystem>
#include <fstream>

using namespace lineage::util;
namespace fs = std::filesystem;

class TextTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
            ("lineage_text_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path write_bytes(const std::string& name, const std::string& bytes) {
        fs::path path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << bytes;
        return path;
    }

    fs::path dir_;
};

TEST_F(TextTest, SplitListTrimsAndDropsEmpty) {
    auto parts = split_list(" a, ,b ,, c");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "c");
}

TEST_F(TextTest, TrimAndLower) {
    EXPECT_EQ(trim("  x y \t\n"), "x y");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("Rpt_UDP.X"), "rpt_udp.x");
}

TEST_F(TextTest, ContainsWordHonoursBoundaries) {
    EXPECT_TRUE(contains_word("insert into db.t\n", "db.t"));
    EXPECT_TRUE(contains_word("db.t", "db.t"));
    EXPECT_FALSE(contains_word("from db.t1 join", "db.t"));
    EXPECT_FALSE(contains_word("from mydb.t", "db.t"));
    EXPECT_TRUE(contains_word("mydb.t db.t", "db.t"));
    EXPECT_FALSE(contains_word("anything", ""));
}

TEST_F(TextTest, StripInvisible) {
    std::string text = "\xEF\xBB\xBF" "ab\xC2\xA0" "c\xE2\x80\x8B" "d";
    EXPECT_EQ(strip_invisible(text), "ab cd");
}

TEST_F(TextTest, ReadTextKeepsUtf8) {
    auto path = write_bytes("utf8.py", "caf\xC3\xA9");
    auto text = read_text(path);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "caf\xC3\xA9");
}

TEST_F(TextTest, ReadTextTranscodesLatin1) {
    auto path = write_bytes("latin1.sas", "caf\xE9");
    auto text = read_text(path);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "caf\xC3\xA9");
    EXPECT_TRUE(is_valid_utf8(*text));
}

TEST_F(TextTest, ReadTextMissingFile) {
    EXPECT_FALSE(read_text(dir_ / "missing.py").has_value());
}
