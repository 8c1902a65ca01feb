// =============================================================================
// path_enumerator.hpp - Every upstream path from a target to its sources
// =============================================================================
// Depth-first walk over the implicit graph table -> merged upstreams. Each
// emitted path is [target, layer 1, ..., source]. A table with no writer (or
// whose writers read nothing) ends a path. A table already on the current
// path is a cycle: the branch is cut and the path ends with that table, so
// A <- B <- A yields [A, B, A].
//
// Enumeration is bounded: max_paths and the time budget stop the whole walk,
// max_depth cuts only the branch that reaches it. Either way the result says
// it was truncated and why.
// =============================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "lineage/types.hpp"
#include "lineage/upstream_resolver.hpp"
#include "lineage/writer_index.hpp"

namespace lineage {

struct EnumerationLimits {
    size_t max_paths = 100000;
    size_t max_depth = 64;                       // tables per path
    std::chrono::milliseconds time_budget{0};    // 0 = unbounded
};

enum class TruncationReason {
    None,
    PathLimit,
    DepthLimit,
    TimeLimit
};

const char* truncation_reason_name(TruncationReason reason);

struct EnumerationResult {
    std::string target;
    std::vector<LineagePath> paths;   // depth-first, upstreams in sorted order
    bool truncated = false;
    TruncationReason reason = TruncationReason::None;
    size_t cycles_cut = 0;
};

class PathEnumerator {
public:
    // lookup, source and policy must outlive the enumerator. Passing the
    // same cache to several enumerators shares resolved upstreams.
    PathEnumerator(const WriterLookup& lookup,
                   const UpstreamSource& source,
                   const UpstreamMergePolicy& policy,
                   EnumerationLimits limits = {},
                   std::shared_ptr<UpstreamCache> cache = nullptr);

    // Thread-safe; concurrent calls share the upstream cache
    EnumerationResult enumerate(const std::string& target) const;

    // Merged upstreams of one table (resolved once per cache)
    TableSet upstreams(const std::string& table) const;

    const EnumerationLimits& limits() const { return limits_; }
    const std::shared_ptr<UpstreamCache>& cache() const { return cache_; }

private:
    struct Walk;

    void walk(const std::string& table, Walk& state) const;
    void emit(LineagePath path, Walk& state) const;
    void truncate(Walk& state, TruncationReason reason, bool stop) const;

    const WriterLookup& lookup_;
    const UpstreamSource& source_;
    const UpstreamMergePolicy& policy_;
    EnumerationLimits limits_;
    std::shared_ptr<UpstreamCache> cache_;
};

} // namespace lineage
