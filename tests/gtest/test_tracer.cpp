// =============================================================================
// End-to-end Tracer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lineage/error.hpp"
#include "lineage/tracer.hpp"

#include <filesystem>
#include <fstream>

using namespace lineage;
namespace fs = std::filesystem;

class TracerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
            ("lineage_tracer_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_);

        write_file("jobs/report.py",
                   "# Output table(s):\n"
                   "#   RPT.Summary\n"
                   "\n"
                   "orders = spark.table('stg.orders')\n"
                   "branches = spark.table(\"REF.Branch\")\n");
        write_file("sql/stg_orders.sql",
                   "CREATE OR REPLACE VIEW STG.Orders AS\n"
                   "SELECT o.* FROM raw.orders o JOIN ref.branch b ON o.b = b.b\n");
        write_file("sas/raw.sas",
                   "data raw.orders;\n"
                   "  set src.feed;\n"
                   "run;\n");
        write_file("jobs/loop_a.py",
                   "# Output tables: db.loop_a\n"
                   "b = spark.table('db.loop_b')\n");
        write_file("jobs/loop_b.py",
                   "# Output tables: db.loop_b\n"
                   "a = spark.table('db.loop_a')\n");
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    fs::path write_file(const std::string& relative, const std::string& content) {
        fs::path path = root_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    TraceOptions options(std::vector<std::string> targets) {
        TraceOptions opts;
        opts.root = root_;
        opts.targets = std::move(targets);
        opts.threads = 2;
        return opts;
    }

    fs::path root_;
};

// =============================================================================
// Full runs
// =============================================================================

TEST_F(TracerTest, TracesAcrossDialects) {
    TraceReport report = LineageTracer(options({"RPT.Summary"})).run();

    EXPECT_EQ(report.files_indexed, 5u);
    ASSERT_EQ(report.targets, std::vector<std::string>{"rpt.summary"});
    ASSERT_EQ(report.table.size(), 3u);

    const auto& rows = report.table.rows();
    EXPECT_EQ(rows[0], (LineageRow{"rpt.summary", {}, "ref.branch"}));
    EXPECT_EQ(rows[1], (LineageRow{"rpt.summary", {"stg.orders", "raw.orders"}, "src.feed"}));
    EXPECT_EQ(rows[2], (LineageRow{"rpt.summary", {"stg.orders"}, "ref.branch"}));

    EXPECT_EQ(report.table.layer_count(), 2u);
    EXPECT_EQ(report.path_count(), 3u);
    EXPECT_EQ(report.truncated_targets(), 0u);
}

TEST_F(TracerTest, CycleEndsWithRepeatedTable) {
    TraceReport report = LineageTracer(options({"db.loop_a"})).run();

    ASSERT_EQ(report.table.size(), 1u);
    EXPECT_EQ(report.table.rows()[0], (LineageRow{"db.loop_a", {"db.loop_b"}, "db.loop_a"}));
    EXPECT_EQ(report.results[0].cycles_cut, 1u);
}

TEST_F(TracerTest, TargetsKeepRequestOrderWithoutDuplicates) {
    TraceReport report = LineageTracer(options({"db.loop_a", "RPT.SUMMARY", "rpt.summary"})).run();

    std::vector<std::string> expected = {"db.loop_a", "rpt.summary"};
    EXPECT_EQ(report.targets, expected);
    EXPECT_EQ(report.table.rows().front().target, "db.loop_a");
    EXPECT_EQ(report.table.rows().back().target, "rpt.summary");
}

TEST_F(TracerTest, RepeatedRunsAreIdentical) {
    TraceOptions opts = options({"rpt.summary", "db.loop_b"});
    opts.threads = 4;

    TraceReport first = LineageTracer(opts).run();
    TraceReport second = LineageTracer(opts).run();
    EXPECT_EQ(first.table.rows(), second.table.rows());
}

TEST_F(TracerTest, BareTargetExpandsToQualifiedNames) {
    TraceReport report = LineageTracer(options({"summary", "not_indexed"})).run();
    EXPECT_EQ(report.targets, std::vector<std::string>{"rpt.summary"});
}

TEST_F(TracerTest, ExpandLayersPromotesIntermediates) {
    TraceOptions opts = options({"rpt.summary"});
    opts.expand_layers = true;

    TraceReport report = LineageTracer(opts).run();
    ASSERT_EQ(report.table.size(), 6u);
    EXPECT_EQ(report.table.rows()[3], (LineageRow{"stg.orders", {"raw.orders"}, "src.feed"}));
    EXPECT_EQ(report.table.rows()[4], (LineageRow{"stg.orders", {}, "ref.branch"}));
    EXPECT_EQ(report.table.rows()[5], (LineageRow{"raw.orders", {}, "src.feed"}));
}

TEST_F(TracerTest, PathBudgetIsReported) {
    TraceOptions opts = options({"rpt.summary"});
    opts.limits.max_paths = 1;

    TraceReport report = LineageTracer(opts).run();
    EXPECT_EQ(report.table.size(), 1u);
    EXPECT_EQ(report.truncated_targets(), 1u);
    EXPECT_EQ(report.results[0].reason, TruncationReason::PathLimit);
}

TEST_F(TracerTest, IntersectionPolicyByName) {
    write_file("jobs/report_v2.py",
               "# Output tables: rpt.summary\n"
               "orders = spark.table('stg.orders')\n");

    TraceOptions opts = options({"rpt.summary"});
    opts.policy = "intersection";

    TraceReport report = LineageTracer(opts).run();
    ASSERT_EQ(report.table.size(), 2u);
    for (const auto& row : report.table.rows()) {
        ASSERT_FALSE(row.layers.empty());
        EXPECT_EQ(row.layers.front(), "stg.orders");
    }
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(TracerTest, NoTargets) {
    try {
        LineageTracer(options({})).run();
        FAIL() << "expected CorpusError";
    } catch (const CorpusError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NO_TARGETS);
    }
}

TEST_F(TracerTest, OnlyUnknownBareTargets) {
    try {
        LineageTracer(options({"nothing_here"})).run();
        FAIL() << "expected CorpusError";
    } catch (const CorpusError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NO_TARGETS);
    }
}

TEST_F(TracerTest, MissingRoot) {
    TraceOptions opts = options({"rpt.summary"});
    opts.root = root_ / "absent";

    try {
        LineageTracer(opts).run();
        FAIL() << "expected CorpusError";
    } catch (const CorpusError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CORPUS_NOT_FOUND);
    }
}

TEST_F(TracerTest, EmptyCorpus) {
    TraceOptions opts = options({"rpt.summary"});
    opts.extensions = {".scala"};

    try {
        LineageTracer(opts).run();
        FAIL() << "expected CorpusError";
    } catch (const CorpusError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EMPTY_CORPUS);
    }
}

TEST_F(TracerTest, UnknownPolicy) {
    TraceOptions opts = options({"rpt.summary"});
    opts.policy = "majority";
    EXPECT_THROW(LineageTracer(opts).run(), InvalidArgumentError);
}

// =============================================================================
// Target helpers
// =============================================================================

TEST_F(TracerTest, ExpandTargetsKeepsIndexedBareNames) {
    Corpus corpus(root_);
    corpus.add(root_ / "local.sas", "data localtbl; set src.x; run;\n");
    ExtractorRegistry registry = ExtractorRegistry::with_default_dialects();
    WriterIndex index(corpus, registry);
    index.build();

    std::vector<std::string> expected = {"localtbl", "src.other"};
    EXPECT_EQ(expand_targets({"LocalTbl", " ", "src.other"}, index), expected);
}

TEST_F(TracerTest, ReadTargetsFile) {
    fs::path path = write_file("targets.txt",
                               "# nightly targets\n"
                               "rpt.summary\n"
                               "\n"
                               "   db.loop_a  \n");

    std::vector<std::string> expected = {"rpt.summary", "db.loop_a"};
    EXPECT_EQ(read_targets_file(path), expected);

    try {
        read_targets_file(root_ / "missing.txt");
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FILE_NOT_FOUND);
    }
}
