#include "lineage/upstream_resolver.hpp"
#include "lineage/error.hpp"
#include "lineage/logging.hpp"
#include "lineage/util/text.hpp"

#include <algorithm>
#include <iterator>

namespace lineage {

UpstreamResolver::UpstreamResolver(const Corpus& corpus, const ExtractorRegistry& registry)
    : corpus_(corpus), registry_(registry) {}

TableSet UpstreamResolver::upstreams_of(const Writer& writer) const {
    const TableExtractor* extractor = registry_.for_kind(writer.kind);
    if (!extractor) {
        LOG_WARN("No extractor registered for ", writer_kind_name(writer.kind),
                 " writer ", writer.path);
        return {};
    }

    if (const Corpus::File* file = corpus_.find(writer.path)) {
        return extractor->read_tables(file->text);
    }

    auto text = util::read_text(writer.path);
    if (!text) return {};
    return extractor->read_tables(*text);
}

TableSet UnionMergePolicy::merge(const std::vector<TableSet>& per_writer) const {
    TableSet merged;
    for (const auto& upstreams : per_writer) {
        merged.insert(upstreams.begin(), upstreams.end());
    }
    return merged;
}

TableSet IntersectionMergePolicy::merge(const std::vector<TableSet>& per_writer) const {
    if (per_writer.empty()) return {};

    TableSet merged = per_writer.front();
    for (size_t i = 1; i < per_writer.size() && !merged.empty(); ++i) {
        TableSet next;
        std::set_intersection(merged.begin(), merged.end(),
                              per_writer[i].begin(), per_writer[i].end(),
                              std::inserter(next, next.end()));
        merged = std::move(next);
    }
    return merged;
}

std::unique_ptr<UpstreamMergePolicy> make_merge_policy(const std::string& name) {
    std::string key = util::to_lower(util::trim(name));
    if (key == "union") return std::make_unique<UnionMergePolicy>();
    if (key == "intersection") return std::make_unique<IntersectionMergePolicy>();
    throw InvalidArgumentError("Unknown writer merge policy '" + name + "'", __func__,
                               "Use 'union' or 'intersection'");
}

} // namespace lineage
