#pragma once

#include "lineage/extract/extractor.hpp"

namespace lineage {

// SQL view DDL. The first CREATE [OR REPLACE] VIEW name is the table the
// file writes (indexed only when schema-qualified); every schema.table
// after FROM or JOIN is read.
class ViewExtractor : public TableExtractor {
public:
    WriterKind kind() const override { return WriterKind::ViewDefinition; }
    std::string name() const override { return "view"; }

    TableSet written_tables(const std::string& text) const override;
    TableSet read_tables(const std::string& text) const override;

    // All view names defined in the file, bare ones included
    TableSet declared_targets(const std::string& text) const override;
};

} // namespace lineage
