#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "lineage/types.hpp"

namespace lineage {

// One path as a result row: Target Table, Layer 1..k, Source Table
struct LineageRow {
    std::string target;
    std::vector<std::string> layers;
    std::string source;

    bool operator==(const LineageRow& other) const {
        return target == other.target && layers == other.layers && source == other.source;
    }
};

// [target] -> source = target, no layers
// [target, x1..xk, s] -> layers x1..xk, source s
std::vector<LineageRow> shape_rows(const std::string& target, const std::vector<LineagePath>& paths);

// Rows of a whole run. The number of Layer columns is the widest row's
// layer count; shorter rows leave the trailing layer cells unset.
class LineageTable {
public:
    void append(const LineageRow& row);
    void append(const std::vector<LineageRow>& rows);

    const std::vector<LineageRow>& rows() const { return rows_; }
    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    size_t layer_count() const { return layer_count_; }

    // Widen to at least count Layer columns (a table read back keeps the
    // width of its file even when the trailing layers are all empty)
    void reserve_layers(size_t count) { layer_count_ = std::max(layer_count_, count); }

    // "Target Table", "Layer 1", ..., "Layer N", "Source Table"
    std::vector<std::string> column_names() const;

    // Cells in column order; unset layers are nullopt
    std::vector<std::optional<std::string>> record(size_t row) const;

private:
    std::vector<LineageRow> rows_;
    size_t layer_count_ = 0;
};

} // namespace lineage
