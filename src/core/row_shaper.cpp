#include "lineage/row_shaper.hpp"
#include "lineage/logging.hpp"

#include <algorithm>

namespace lineage {

std::vector<LineageRow> shape_rows(const std::string& target, const std::vector<LineagePath>& paths) {
    std::vector<LineageRow> rows;
    rows.reserve(paths.size());

    for (const auto& path : paths) {
        if (path.empty()) continue;
        if (path.front() != target) {
            LOG_WARN("Path for '", target, "' starts at '", path.front(), "'");
        }

        LineageRow row;
        row.target = target;
        row.source = path.back();
        if (path.size() > 2) {
            row.layers.assign(path.begin() + 1, path.end() - 1);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

void LineageTable::append(const LineageRow& row) {
    layer_count_ = std::max(layer_count_, row.layers.size());
    rows_.push_back(row);
}

void LineageTable::append(const std::vector<LineageRow>& rows) {
    rows_.reserve(rows_.size() + rows.size());
    for (const auto& row : rows) append(row);
}

std::vector<std::string> LineageTable::column_names() const {
    std::vector<std::string> columns;
    columns.reserve(layer_count_ + 2);
    columns.push_back("Target Table");
    for (size_t i = 1; i <= layer_count_; ++i) {
        columns.push_back("Layer " + std::to_string(i));
    }
    columns.push_back("Source Table");
    return columns;
}

std::vector<std::optional<std::string>> LineageTable::record(size_t row) const {
    const LineageRow& r = rows_.at(row);

    std::vector<std::optional<std::string>> cells;
    cells.reserve(layer_count_ + 2);
    cells.emplace_back(r.target);
    for (size_t i = 0; i < layer_count_; ++i) {
        if (i < r.layers.size()) {
            cells.emplace_back(r.layers[i]);
        } else {
            cells.emplace_back(std::nullopt);
        }
    }
    cells.emplace_back(r.source);
    return cells;
}

} // namespace lineage
