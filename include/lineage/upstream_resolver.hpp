// =============================================================================
// upstream_resolver.hpp - Writer -> upstream tables
// =============================================================================
// UpstreamSource turns one writer into the tables it reads. A merge policy
// folds the per-writer sets of an ambiguous table into one set, and the
// UpstreamCache memoises that merged set per table for the whole run.
// =============================================================================

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "lineage/corpus.hpp"
#include "lineage/extract/extractor.hpp"
#include "lineage/types.hpp"

namespace lineage {

class UpstreamSource {
public:
    virtual ~UpstreamSource() = default;
    virtual TableSet upstreams_of(const Writer& writer) const = 0;
};

// Reads the writer's text (from the corpus, or from disk when the writer is
// not part of it) and applies the extractor registered for the writer's kind.
class UpstreamResolver : public UpstreamSource {
public:
    UpstreamResolver(const Corpus& corpus, const ExtractorRegistry& registry);

    TableSet upstreams_of(const Writer& writer) const override;

private:
    const Corpus& corpus_;
    const ExtractorRegistry& registry_;
};

// -----------------------------------------------------------------------------
// Ambiguous writers
// -----------------------------------------------------------------------------

class UpstreamMergePolicy {
public:
    virtual ~UpstreamMergePolicy() = default;
    virtual std::string name() const = 0;
    virtual TableSet merge(const std::vector<TableSet>& per_writer) const = 0;
};

// Every table any writer reads
class UnionMergePolicy : public UpstreamMergePolicy {
public:
    std::string name() const override { return "union"; }
    TableSet merge(const std::vector<TableSet>& per_writer) const override;
};

// Only tables every writer reads
class IntersectionMergePolicy : public UpstreamMergePolicy {
public:
    std::string name() const override { return "intersection"; }
    TableSet merge(const std::vector<TableSet>& per_writer) const override;
};

// "union" or "intersection"; throws InvalidArgumentError otherwise
std::unique_ptr<UpstreamMergePolicy> make_merge_policy(const std::string& name);

// -----------------------------------------------------------------------------
// Shared memo table
// -----------------------------------------------------------------------------

class UpstreamCache {
public:
    // Cached set for table, computing it with compute() on first use. Two
    // threads racing on the same table may both compute; the first result
    // stored wins and both callers see it.
    template<typename Compute>
    TableSet get_or_compute(const std::string& table, Compute&& compute) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(table);
            if (it != entries_.end()) return it->second;
        }

        TableSet computed = compute();

        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.emplace(table, std::move(computed)).first->second;
    }

    std::optional<TableSet> find(const std::string& table) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(table);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, TableSet> entries_;
};

} // namespace lineage
