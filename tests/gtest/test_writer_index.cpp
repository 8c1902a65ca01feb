// =============================================================================
// Corpus and Writer Index Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lineage/corpus.hpp"
#include "lineage/error.hpp"
#include "lineage/thread_pool.hpp"
#include "lineage/writer_index.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace lineage;
namespace fs = std::filesystem;

class WriterIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
            ("lineage_writer_index_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_);

        write_file("jobs/load.py",
                   "# Output table(s):\n"
                   "#   mart.daily\n"
                   "\n"
                   "events = spark.table('raw.events')\n");
        write_file("views/v_daily.sql",
                   "create view mart.v_daily as select * from mart.daily\n");
        write_file("sas/build.sas",
                   "data stage.orders; set raw.orders; run;\n");
        write_file(".hidden/secret.py", "# Output tables: mart.secret\n");
        write_file("notes.txt", "mart.daily is written by load.py\n");
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

    std::vector<std::string> extensions_ = {".py", ".sql", ".sas"};
    ExtractorRegistry registry_ = ExtractorRegistry::with_default_dialects();
    fs::path root_;
};

// =============================================================================
// Corpus discovery
// =============================================================================

TEST_F(WriterIndexTest, ListsSortedFilesAndSkipsHiddenDirectories) {
    write_file("sas/UPPER.SAS", "data stage.upper; set raw.x; run;\n");

    auto files = list_source_files(root_, extensions_);
    ASSERT_EQ(files.size(), 4u);
    EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));

    for (const auto& file : files) {
        EXPECT_EQ(file.string().find(".hidden"), std::string::npos) << file;
        EXPECT_NE(file.extension().string(), ".txt");
    }
}

TEST_F(WriterIndexTest, ExtensionsWithoutDot) {
    auto files = list_source_files(root_, {"SAS"});
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename().string(), "build.sas");
}

TEST_F(WriterIndexTest, MissingRootIsReported) {
    try {
        list_source_files(root_ / "absent", extensions_);
        FAIL() << "expected CorpusError";
    } catch (const CorpusError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CORPUS_NOT_FOUND);
    }
}

TEST_F(WriterIndexTest, EmptyCorpusIsReported) {
    fs::path empty = root_ / "empty";
    fs::create_directories(empty);

    try {
        Corpus::load(empty, extensions_);
        FAIL() << "expected CorpusError";
    } catch (const CorpusError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EMPTY_CORPUS);
    }
}

TEST_F(WriterIndexTest, LoadKeepsTextAndLoweredCopy) {
    write_file("jobs/Mixed.py", "X = spark.table('RAW.Mixed')\n");

    ThreadPool pool(2);
    Corpus corpus = Corpus::load(root_, extensions_, &pool);
    EXPECT_EQ(corpus.size(), 4u);
    EXPECT_EQ(corpus.skipped(), 0u);

    const Corpus::File* file = corpus.find(root_ / "jobs/Mixed.py");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->text, "X = spark.table('RAW.Mixed')\n");
    EXPECT_EQ(file->lowered, "x = spark.table('raw.mixed')\n");
    EXPECT_EQ(corpus.relative_path(file->path), "jobs/Mixed.py");
}

// =============================================================================
// Index build and lookup
// =============================================================================

TEST_F(WriterIndexTest, BuildIndexesEveryDialect) {
    Corpus corpus = Corpus::load(root_, extensions_);
    WriterIndex index(corpus, registry_);
    ThreadPool pool(2);
    index.build(&pool);

    std::vector<std::string> expected = {"mart.daily", "mart.v_daily", "stage.orders"};
    EXPECT_EQ(index.keys(), expected);
    EXPECT_FALSE(index.contains("mart.secret"));

    auto writers = index.writers_for("MART.Daily");
    ASSERT_EQ(writers.size(), 1u);
    EXPECT_EQ(writers[0].path, (root_ / "jobs/load.py").string());
    EXPECT_EQ(writers[0].kind, WriterKind::PipelineScript);

    auto views = index.writers_for("mart.v_daily");
    ASSERT_EQ(views.size(), 1u);
    EXPECT_EQ(views[0].kind, WriterKind::ViewDefinition);

    auto sas = index.writers_for("stage.orders");
    ASSERT_EQ(sas.size(), 1u);
    EXPECT_EQ(sas[0].kind, WriterKind::SasProgram);
}

TEST_F(WriterIndexTest, UnknownTableHasNoWriters) {
    Corpus corpus = Corpus::load(root_, extensions_);
    WriterIndex index(corpus, registry_);
    index.build();

    EXPECT_TRUE(index.writers_for("raw.events").empty());
    EXPECT_TRUE(index.writers_for("nowhere.table").empty());
}

TEST_F(WriterIndexTest, IndexedWriterMustMentionTheTable) {
    Corpus corpus = Corpus::load(root_, extensions_);
    WriterIndex index(corpus, registry_);
    index.build();

    Writer stale{(root_ / "sas/build.sas").string(), WriterKind::SasProgram};
    index.add("mart.daily", stale);

    EXPECT_EQ(index.indexed_writers("mart.daily").size(), 2u);

    auto writers = index.writers_for("mart.daily");
    ASSERT_EQ(writers.size(), 1u);
    EXPECT_EQ(writers[0].path, (root_ / "jobs/load.py").string());
}

TEST_F(WriterIndexTest, MacroNamedSasTargetIsConfirmed) {
    Corpus corpus(root_);
    corpus.add(root_ / "macro.sas",
               "%let lib=stg;\n"
               "data &lib..out;\n"
               "  set raw.feed;\n"
               "run;\n");

    WriterIndex index(corpus, registry_);
    index.build();
    ASSERT_TRUE(index.contains("stg.out"));

    auto writers = index.writers_for("stg.out");
    ASSERT_EQ(writers.size(), 1u);
    EXPECT_EQ(writers[0].path, (root_ / "macro.sas").string());
    EXPECT_EQ(writers[0].kind, WriterKind::SasProgram);
}

TEST_F(WriterIndexTest, FallsBackToCandidateFiles) {
    Corpus corpus(root_);
    corpus.add(root_ / "late.py", "df.write.insertInto('mart.late')\n");

    // Nothing built: the lookup parses the files that mention the table
    WriterIndex index(corpus, registry_);
    EXPECT_FALSE(index.contains("mart.late"));

    auto writers = index.writers_for("mart.late");
    ASSERT_EQ(writers.size(), 1u);
    EXPECT_EQ(writers[0].path, (root_ / "late.py").string());
}

TEST_F(WriterIndexTest, WordBoundaryCandidates) {
    Corpus corpus(root_);
    corpus.add(root_ / "longer.py", "df.write.insertInto('mart.daily_v2')\n");

    WriterIndex index(corpus, registry_);
    index.build();

    EXPECT_TRUE(index.writers_for("mart.daily").empty());
    EXPECT_EQ(index.writers_for("mart.daily_v2").size(), 1u);
}

TEST_F(WriterIndexTest, ExpandBareName) {
    Corpus corpus(root_);
    corpus.add(root_ / "a.py", "# Output tables: mart.orders, stage.orders, stage.orders_hist\n");

    WriterIndex index(corpus, registry_);
    index.build();

    std::vector<std::string> expected = {"mart.orders", "stage.orders"};
    EXPECT_EQ(index.expand_bare_name("Orders"), expected);
    EXPECT_TRUE(index.expand_bare_name("missing").empty());
}
