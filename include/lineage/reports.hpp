// =============================================================================
// reports.hpp - Derived reports over a corpus or a lineage table
// =============================================================================

#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <tuple>
#include <vector>

#include "lineage/corpus.hpp"
#include "lineage/extract/extractor.hpp"
#include "lineage/extract/sas_extractor.hpp"
#include "lineage/row_shaper.hpp"

namespace lineage {

// -----------------------------------------------------------------------------
// Layer promotion
// -----------------------------------------------------------------------------

// Every occurrence of a layer that is not an input target (case-insensitive)
// becomes a row: target = the layer, layers = the non-empty layers after it,
// source = the row's source. Rows come out grouped by target (input targets
// first, in input order), exact duplicates dropped. The Layer column count of
// the input is kept.
LineageTable promote_layers(const LineageTable& table);

// -----------------------------------------------------------------------------
// Script -> target mapping
// -----------------------------------------------------------------------------

struct ScriptTarget {
    std::string script;   // relative to the corpus root, '/' separated
    std::string table;

    bool operator<(const ScriptTarget& other) const {
        return std::tie(script, table) < std::tie(other.script, other.table);
    }
    bool operator==(const ScriptTarget& other) const {
        return script == other.script && table == other.table;
    }
};

// Sorted by script, then table
std::vector<ScriptTarget> build_script_target_mapping(const Corpus& corpus,
                                                      const ExtractorRegistry& registry);

// Header "script name,target table"
void write_script_target_csv(const std::vector<ScriptTarget>& mapping, std::ostream& out);
void write_script_target_csv(const std::vector<ScriptTarget>& mapping,
                             const std::filesystem::path& path);

// -----------------------------------------------------------------------------
// SAS table report
// -----------------------------------------------------------------------------

struct SasFileReport {
    std::string script;
    SasTableUsage usage;
    SasMainChain chain;
};

// One entry per .sas file of the corpus, in path order
std::vector<SasFileReport> build_sas_report(const Corpus& corpus);

void print_sas_report(const std::vector<SasFileReport>& reports, std::ostream& out);

} // namespace lineage
