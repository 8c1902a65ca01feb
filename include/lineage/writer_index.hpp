// =============================================================================
// writer_index.hpp - Table -> writer scripts
// =============================================================================
// Built once per run from the corpus, then read-only. A lookup re-confirms the
// indexed writers against the text of the candidate files (files that mention
// the table as a whole word); a SAS writer outside the candidates is confirmed
// by re-extracting its macro-expanded program. When no writer survives, the
// candidates are re-extracted directly so a table written only in a shape the
// index missed is still found.
// =============================================================================

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "lineage/corpus.hpp"
#include "lineage/extract/extractor.hpp"
#include "lineage/types.hpp"

namespace lineage {

class ThreadPool;

// Answers "which scripts write this table?"
class WriterLookup {
public:
    virtual ~WriterLookup() = default;

    // Writers sorted by (path, kind), no duplicates
    virtual std::vector<Writer> writers_for(const std::string& table) const = 0;
};

class WriterIndex : public WriterLookup {
public:
    WriterIndex(const Corpus& corpus, const ExtractorRegistry& registry);

    // Extract every corpus file (in parallel when a pool is given)
    void build(ThreadPool* pool = nullptr);

    void add(const std::string& table, const Writer& writer);

    std::vector<Writer> writers_for(const std::string& table) const override;

    // Writers recorded at build time, without re-confirmation
    std::vector<Writer> indexed_writers(const std::string& table) const;

    bool contains(const std::string& table) const { return index_.count(table) > 0; }
    std::vector<std::string> keys() const;
    size_t size() const { return index_.size(); }

    // Every indexed "schema.<bare>" key, sorted
    std::vector<std::string> expand_bare_name(const std::string& bare) const;

private:
    std::vector<const Corpus::File*> candidate_files(const std::string& table) const;
    std::vector<Writer> extract_writers(const Corpus::File& file, const std::string& table) const;
    bool confirms_expanded(const Writer& writer, const std::string& table) const;

    const Corpus& corpus_;
    const ExtractorRegistry& registry_;
    std::map<std::string, std::set<Writer>> index_;
};

} // namespace lineage
