#include "sheetscan/table/Table.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace sheetscan {
namespace table {

const char* toString(TableMode mode) noexcept {
    switch (mode) {
        case TableMode::Verbose: return "verbose";
        case TableMode::Compact: return "compact";
    }
    return "unknown";
}

const Column* Table::findColumn(int col) const {
    auto it = std::lower_bound(columns_.begin(), columns_.end(), col,
                               [](const Column& c, int value) { return c.index < value; });
    return (it != columns_.end() && it->index == col) ? &*it : nullptr;
}

const Row* Table::findRow(int row) const {
    auto it = std::lower_bound(rows_.begin(), rows_.end(), row,
                               [](const Row& r, int value) { return r.index < value; });
    return (it != rows_.end() && it->index == row) ? &*it : nullptr;
}

std::vector<std::string> Table::columnLabels() const {
    std::vector<std::string> labels;
    labels.reserve(columns_.size());
    for (const auto& column : columns_) {
        labels.push_back(column.label);
    }
    return labels;
}

const TableCell* Table::findCell(int row, int col) const {
    const Row* r = findRow(row);
    if (r == nullptr) {
        return nullptr;
    }
    for (const auto& cell : r->cells) {
        if (cell.col == col) {
            return &cell;
        }
    }
    return nullptr;
}

CellCounts countCells(const core::Grid& grid, const detection::Region& region) {
    CellCounts counts;
    if (!region.isValid()) {
        return counts;
    }
    for (auto it = grid.rows().lower_bound(region.start_row);
         it != grid.rows().end() && it->first <= region.end_row; ++it) {
        for (auto cit = it->second.lower_bound(region.start_col);
             cit != it->second.end() && cit->first <= region.end_col; ++cit) {
            const int weight = clippedRunWeight(cit->second, region.start_col, region.end_col);
            counts.cells += weight;
            if (cit->second.value.isNumber()) {
                counts.numeric += weight;
            }
        }
    }
    return counts;
}

int clippedRunWeight(const core::GridCell& cell, int start_col, int end_col) {
    if (cell.run_length < 1) {
        return 0;
    }
    const int first = std::max(cell.col, start_col);
    const int last = std::min(cell.lastCol(), end_col);
    return std::max(last - first + 1, 0);
}

std::string makeTableId(size_t index) {
    return fmt::format("table_{}", index + 1);
}

}} // namespace sheetscan::table
