#include "sheetscan/core/Grid.hpp"
#include "sheetscan/core/Exception.hpp"

#include <fmt/format.h>

namespace sheetscan {
namespace core {

Grid::Grid(const SheetBounds& bounds, std::vector<GridCell> cells,
           const FrozenPanes& frozen, std::string name,
           std::vector<SheetBounds> merged_ranges)
    : bounds_(bounds)
    , frozen_(frozen)
    , name_(std::move(name))
    , merged_ranges_(std::move(merged_ranges)) {
    if (!bounds_.isValid()) {
        SHEETSCAN_THROW_BOUNDS(fmt::format("Sheet bounds rows {}..{} cols {}..{} have min > max",
                                           bounds_.min_row, bounds_.max_row,
                                           bounds_.min_col, bounds_.max_col));
    }

    for (auto& cell : cells) {
        if (cell.row < 1 || cell.col < 1 || !cell.value.isMeaningful()) {
            continue;
        }
        if (cell.run_length < 1) {
            cell.run_length = 1;
        }
        auto& row_map = rows_[cell.row];
        auto result = row_map.insert_or_assign(cell.col, std::move(cell));
        if (result.second) {
            ++cell_count_;
        }
    }
}

const GridCell* Grid::find(int row, int col) const {
    auto rit = rows_.find(row);
    if (rit == rows_.end()) {
        return nullptr;
    }
    auto cit = rit->second.find(col);
    return cit == rit->second.end() ? nullptr : &cit->second;
}

const Grid::RowMap& Grid::row(int row) const {
    static const RowMap kEmpty;
    auto it = rows_.find(row);
    return it == rows_.end() ? kEmpty : it->second;
}

bool Grid::hasMergedCellsIn(int start_row, int end_row, int start_col, int end_col) const {
    for (const auto& m : merged_ranges_) {
        if (m.min_row <= end_row && m.max_row >= start_row &&
            m.min_col <= end_col && m.max_col >= start_col) {
            return true;
        }
    }
    return false;
}

std::vector<const GridCell*> Grid::rowCells(int row, int min_col, int max_col) const {
    std::vector<const GridCell*> out;
    auto rit = rows_.find(row);
    if (rit == rows_.end() || min_col > max_col) {
        return out;
    }
    for (auto it = rit->second.lower_bound(min_col);
         it != rit->second.end() && it->first <= max_col; ++it) {
        out.push_back(&it->second);
    }
    return out;
}

std::vector<int> Grid::populatedRows(int min_row, int max_row, int min_col, int max_col) const {
    std::vector<int> out;
    if (min_row > max_row || min_col > max_col) {
        return out;
    }
    for (auto it = rows_.lower_bound(min_row); it != rows_.end() && it->first <= max_row; ++it) {
        auto cit = it->second.lower_bound(min_col);
        if (cit != it->second.end() && cit->first <= max_col) {
            out.push_back(it->first);
        }
    }
    return out;
}

}} // namespace sheetscan::core
