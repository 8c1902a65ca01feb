#pragma once

#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace lineage {

// Extraction rule a writer's upstream set is computed with
enum class WriterKind {
    PipelineScript,   // Spark job: header "Output table(s)" / insertInto / spark.table
    ViewDefinition,   // SQL DDL: CREATE VIEW ... FROM / JOIN
    SasProgram        // SAS: proc sql / data step blocks with macro expansion
};

inline const char* writer_kind_name(WriterKind kind) {
    switch (kind) {
        case WriterKind::PipelineScript: return "pipeline";
        case WriterKind::ViewDefinition: return "view";
        case WriterKind::SasProgram:     return "sas";
    }
    return "unknown";
}

// A script believed to produce a table
struct Writer {
    std::string path;
    WriterKind kind = WriterKind::PipelineScript;

    bool operator==(const Writer& other) const {
        return path == other.path && kind == other.kind;
    }
    bool operator!=(const Writer& other) const { return !(*this == other); }
    bool operator<(const Writer& other) const {
        return std::tie(path, kind) < std::tie(other.path, other.kind);
    }
};

// Canonical table names, always iterated in lexicographic order
using TableSet = std::set<std::string>;

// [target, layer 1, ..., source]
using LineagePath = std::vector<std::string>;

} // namespace lineage
