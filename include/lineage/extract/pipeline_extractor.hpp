// =============================================================================
// pipeline_extractor.hpp - Spark pipeline scripts
// =============================================================================
// Writes come from the "Output table(s):" section of the leading comment
// header and from insertInto / saveAsTable calls; reads come from
// spark.table('schema.table') calls. Only qualified names are reported.
// =============================================================================

#pragma once

#include "lineage/extract/extractor.hpp"

namespace lineage {

class PipelineExtractor : public TableExtractor {
public:
    WriterKind kind() const override { return WriterKind::PipelineScript; }
    std::string name() const override { return "pipeline"; }

    TableSet written_tables(const std::string& text) const override;
    TableSet read_tables(const std::string& text) const override;
};

// Every schema.table listed under an "Output table(s)" header. A section
// ends at the first code line or at the next header label.
TableSet parse_output_header(const std::string& text);

// .insertInto('schema.table', ...) and .saveAsTable('schema.table') targets
TableSet parse_insert_targets(const std::string& text);

} // namespace lineage
