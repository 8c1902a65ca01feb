#include "lineage/path_enumerator.hpp"
#include "lineage/error.hpp"
#include "lineage/logging.hpp"
#include "lineage/table_name.hpp"

#include <algorithm>

namespace lineage {

const char* truncation_reason_name(TruncationReason reason) {
    switch (reason) {
        case TruncationReason::None:       return "none";
        case TruncationReason::PathLimit:  return "path limit";
        case TruncationReason::DepthLimit: return "depth limit";
        case TruncationReason::TimeLimit:  return "time limit";
    }
    return "unknown";
}

// Per-call state; never shared between threads
struct PathEnumerator::Walk {
    EnumerationResult result;
    std::vector<std::string> chain;   // target .. parent of the current table
    std::chrono::steady_clock::time_point deadline;
    bool has_deadline = false;
    bool stopped = false;
};

PathEnumerator::PathEnumerator(const WriterLookup& lookup,
                               const UpstreamSource& source,
                               const UpstreamMergePolicy& policy,
                               EnumerationLimits limits,
                               std::shared_ptr<UpstreamCache> cache)
    : lookup_(lookup)
    , source_(source)
    , policy_(policy)
    , limits_(limits)
    , cache_(cache ? std::move(cache) : std::make_shared<UpstreamCache>()) {
    LINEAGE_CHECK_ARGUMENT(limits_.max_paths > 0, "max_paths must be positive");
    LINEAGE_CHECK_ARGUMENT(limits_.max_depth > 0, "max_depth must be positive");
}

TableSet PathEnumerator::upstreams(const std::string& table) const {
    return cache_->get_or_compute(table, [&]() {
        std::vector<Writer> writers = lookup_.writers_for(table);
        if (writers.empty()) {
            LOG_DEBUG("No writer for '", table, "', treating it as a source");
            return TableSet{};
        }
        if (writers.size() > 1) {
            LOG_INFO("Table '", table, "' has ", writers.size(), " writers, merging upstreams by ",
                     policy_.name());
        }

        std::vector<TableSet> per_writer;
        per_writer.reserve(writers.size());
        for (const auto& writer : writers) {
            per_writer.push_back(source_.upstreams_of(writer));
        }
        return policy_.merge(per_writer);
    });
}

EnumerationResult PathEnumerator::enumerate(const std::string& target) const {
    const std::string root = normalize_name(target);
    LINEAGE_CHECK_ARGUMENT(!root.empty(), "Target table name must not be empty");

    Walk state;
    state.result.target = root;
    if (limits_.time_budget.count() > 0) {
        state.has_deadline = true;
        state.deadline = std::chrono::steady_clock::now() + limits_.time_budget;
    }

    walk(root, state);

    const EnumerationResult& result = state.result;
    if (result.truncated) {
        LOG_WARN("Lineage of '", root, "' truncated (", truncation_reason_name(result.reason),
                 ") after ", result.paths.size(), " paths");
    } else {
        LOG_DEBUG("Lineage of '", root, "': ", result.paths.size(), " paths");
    }
    return std::move(state.result);
}

void PathEnumerator::walk(const std::string& table, Walk& state) const {
    if (state.stopped) return;

    if (state.has_deadline && std::chrono::steady_clock::now() >= state.deadline) {
        truncate(state, TruncationReason::TimeLimit, true);
        return;
    }

    LineagePath path = state.chain;
    path.push_back(table);

    if (std::find(state.chain.begin(), state.chain.end(), table) != state.chain.end()) {
        LOG_WARN("Cycle detected at '", table, "', cutting branch");
        ++state.result.cycles_cut;
        emit(std::move(path), state);
        return;
    }

    TableSet ups = upstreams(table);
    if (ups.empty()) {
        emit(std::move(path), state);
        return;
    }

    if (path.size() >= limits_.max_depth) {
        truncate(state, TruncationReason::DepthLimit, false);
        emit(std::move(path), state);
        return;
    }

    state.chain.push_back(table);
    for (const auto& upstream : ups) {
        walk(upstream, state);
        if (state.stopped) break;
    }
    state.chain.pop_back();
}

void PathEnumerator::emit(LineagePath path, Walk& state) const {
    if (state.result.paths.size() >= limits_.max_paths) {
        truncate(state, TruncationReason::PathLimit, true);
        return;
    }
    state.result.paths.push_back(std::move(path));
}

void PathEnumerator::truncate(Walk& state, TruncationReason reason, bool stop) const {
    // A reason that stops the walk outranks an earlier branch cut
    if (!state.result.truncated || stop) {
        state.result.reason = reason;
    }
    state.result.truncated = true;
    if (stop) state.stopped = true;
}

} // namespace lineage
