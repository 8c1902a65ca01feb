#include "lineage/tracer.hpp"
#include "lineage/config.hpp"
#include "lineage/error.hpp"
#include "lineage/logging.hpp"
#include "lineage/reports.hpp"
#include "lineage/table_name.hpp"
#include "lineage/thread_pool.hpp"
#include "lineage/upstream_resolver.hpp"
#include "lineage/util/text.hpp"

#include <chrono>
#include <fstream>
#include <set>

namespace lineage {

TraceOptions TraceOptions::from_config(const Config& config) {
    TraceOptions options;
    options.extensions = util::split_list(config.get<std::string>("corpus.extensions", ".py,.sql,.sas"));
    options.limits.max_paths = config.get<size_t>("budget.max_paths", 100000);
    options.limits.max_depth = config.get<size_t>("budget.max_depth", 64);
    options.limits.time_budget = std::chrono::milliseconds(config.get<size_t>("budget.time_ms", 0));
    options.threads = config.get<size_t>("perf.max_threads", 0);
    options.policy = config.get<std::string>("writers.policy", "union");
    return options;
}

size_t TraceReport::truncated_targets() const {
    size_t count = 0;
    for (const auto& result : results) {
        if (result.truncated) ++count;
    }
    return count;
}

size_t TraceReport::path_count() const {
    size_t count = 0;
    for (const auto& result : results) {
        count += result.paths.size();
    }
    return count;
}

std::vector<std::string> expand_targets(const std::vector<std::string>& requested,
                                        const WriterIndex& index) {
    std::vector<std::string> roots;
    std::set<std::string> seen;
    auto push = [&](const std::string& table) {
        if (seen.insert(table).second) roots.push_back(table);
    };

    for (const auto& raw : requested) {
        std::string name = normalize_name(raw);
        if (name.empty()) continue;

        if (is_qualified(name)) {
            push(name);
            continue;
        }

        std::vector<std::string> matches = index.expand_bare_name(name);
        if (!matches.empty()) {
            LOG_INFO("Bare target '", name, "' matches ", matches.size(), " qualified table(s)");
            for (const auto& match : matches) push(match);
        } else if (index.contains(name)) {
            push(name);
        } else {
            LOG_WARN("No indexed table matches bare target '", name, "', skipping");
        }
    }

    if (roots.empty()) {
        throw CorpusError(ErrorCode::NO_TARGETS, "No targets to trace", __func__,
                          "Pass schema-qualified names with --targets or --targets-file");
    }
    return roots;
}

std::vector<std::string> read_targets_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw IOError(ErrorCode::FILE_NOT_FOUND, "Cannot open targets file " + path.string(), __func__);
    }

    std::vector<std::string> targets;
    std::string line;
    while (std::getline(in, line)) {
        std::string name = util::trim(line);
        if (name.empty() || name[0] == '#') continue;
        targets.push_back(name);
    }
    return targets;
}

LineageTracer::LineageTracer(TraceOptions options) : options_(std::move(options)) {}

TraceReport LineageTracer::run() {
    if (options_.targets.empty()) {
        throw CorpusError(ErrorCode::NO_TARGETS, "No targets to trace", __func__,
                          "Pass --targets or --targets-file");
    }

    auto start = std::chrono::steady_clock::now();
    auto policy = make_merge_policy(options_.policy);

    ThreadPool pool(options_.threads);
    LOG_DEBUG("Using ", pool.num_threads(), " worker threads");

    Corpus corpus = Corpus::load(options_.root, options_.extensions, &pool);
    ExtractorRegistry registry = ExtractorRegistry::with_default_dialects();

    WriterIndex index(corpus, registry);
    index.build(&pool);

    TraceReport report;
    report.files_indexed = corpus.size();
    report.tables_indexed = index.size();
    report.targets = expand_targets(options_.targets, index);

    UpstreamResolver resolver(corpus, registry);
    PathEnumerator enumerator(index, resolver, *policy, options_.limits);

    report.results.resize(report.targets.size());
    pool.parallel_for(0, report.targets.size(), [&](size_t i) {
        report.results[i] = enumerator.enumerate(report.targets[i]);
    });

    for (size_t i = 0; i < report.targets.size(); ++i) {
        const EnumerationResult& result = report.results[i];
        LOG_INFO("Target ", report.targets[i], ": ", result.paths.size(), " path(s)",
                 result.cycles_cut ? ", " + std::to_string(result.cycles_cut) + " cycle(s) cut" : "",
                 result.truncated ? std::string(", truncated (") + truncation_reason_name(result.reason) + ")" : "");
        report.table.append(shape_rows(report.targets[i], result.paths));
    }

    if (options_.expand_layers) {
        report.table = promote_layers(report.table);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    LOG_INFO("Traced ", report.targets.size(), " target(s): ", report.table.size(), " rows, ",
             report.truncated_targets(), " truncated, in ", elapsed, " ms");
    return report;
}

} // namespace lineage
