// =============================================================================
// tracer.hpp - One lineage run, end to end
// =============================================================================
// load corpus -> build writer index -> expand requested targets ->
// enumerate paths per target (in parallel, sharing one upstream cache) ->
// shape rows in target order -> optional layer promotion.
// =============================================================================

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "lineage/corpus.hpp"
#include "lineage/extract/extractor.hpp"
#include "lineage/path_enumerator.hpp"
#include "lineage/row_shaper.hpp"
#include "lineage/writer_index.hpp"

namespace lineage {

class Config;

struct TraceOptions {
    std::filesystem::path root;
    std::vector<std::string> extensions{".py", ".sql", ".sas"};
    std::vector<std::string> targets;
    EnumerationLimits limits;
    size_t threads = 0;                 // 0 = hardware concurrency
    std::string policy = "union";
    bool expand_layers = false;

    // corpus.extensions, budget.*, perf.max_threads, writers.policy
    static TraceOptions from_config(const Config& config);
};

struct TraceReport {
    std::vector<std::string> targets;           // after expansion, in output order
    std::vector<EnumerationResult> results;     // one per target
    LineageTable table;
    size_t files_indexed = 0;
    size_t tables_indexed = 0;

    size_t truncated_targets() const;
    size_t path_count() const;
};

// Requested names -> canonical roots. Qualified names pass through; a bare
// name becomes every indexed "schema.<name>" (sorted), or itself when it is
// indexed bare; anything else is dropped with a warning. First occurrence
// wins. Throws CorpusError(NO_TARGETS) when nothing is left.
std::vector<std::string> expand_targets(const std::vector<std::string>& requested,
                                        const WriterIndex& index);

// One target name per line; blank lines and '#' comments ignored
std::vector<std::string> read_targets_file(const std::filesystem::path& path);

class LineageTracer {
public:
    explicit LineageTracer(TraceOptions options);

    // Throws CorpusError for a missing or empty corpus and for an empty
    // target list
    TraceReport run();

    const TraceOptions& options() const { return options_; }

private:
    TraceOptions options_;
};

} // namespace lineage
