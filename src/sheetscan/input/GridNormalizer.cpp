#include "sheetscan/input/GridNormalizer.hpp"
#include "sheetscan/core/Exception.hpp"
#include "sheetscan/utils/CommonUtils.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace sheetscan {
namespace input {

namespace {

// 元组中的列号/游程长度：整数或整值 double
std::optional<int64_t> integralValue(const core::CellValue& v) {
    if (v.isInteger()) {
        return v.asInteger();
    }
    if (v.isDouble()) {
        double d = v.asNumber();
        if (std::isfinite(d) && d == std::floor(d) &&
            std::fabs(d) < static_cast<double>(std::numeric_limits<int>::max())) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

} // namespace

core::Grid GridNormalizer::fromDense(const DenseCellMap& cells, const SheetMeta& meta) {
    std::vector<core::GridCell> out;
    out.reserve(cells.size());

    for (const auto& [key, record] : cells) {
        int row = record.row.value_or(0);
        int col = record.column.value_or(0);

        if (!record.row || !record.column) {
            try {
                auto [parsed_row, parsed_col] = utils::CommonUtils::parseReference(key);
                if (!record.row) row = parsed_row;
                if (!record.column) col = parsed_col;
            } catch (const core::GridException& e) {
                INPUT_DEBUG("Skipping cell '{}': {}", key, e.what());
                continue;
            }
        }

        if (row < 1 || col < 1) {
            INPUT_DEBUG("Skipping cell '{}' with position ({}, {})", key, row, col);
            continue;
        }

        core::GridCell cell;
        cell.row = row;
        cell.col = col;
        cell.value = record.value;
        out.push_back(std::move(cell));
    }

    return build(std::move(out), meta);
}

std::optional<core::GridCell> GridNormalizer::parseCompactTuple(int row, const CompactTuple& tuple) {
    if (tuple.size() < 2) {
        return std::nullopt;
    }

    auto col = integralValue(tuple[0]);
    if (!col || *col < 1) {
        return std::nullopt;
    }

    core::GridCell cell;
    cell.row = row;
    cell.col = static_cast<int>(*col);
    cell.value = tuple[1];

    // 末元素为 > 1 的整数时视为游程长度；两元素元组的末元素就是值本身
    if (tuple.size() >= 3 && tuple.back().isInteger()) {
        int64_t run = tuple.back().asInteger();
        if (run > 1) {
            cell.run_length = static_cast<int>(std::min<int64_t>(run, std::numeric_limits<int>::max() - cell.col));
        }
    }
    return cell;
}

core::Grid GridNormalizer::fromCompact(const std::vector<CompactRow>& rows, const SheetMeta& meta) {
    std::vector<core::GridCell> out;
    size_t skipped = 0;

    for (const auto& row : rows) {
        if (row.r < 1) {
            INPUT_DEBUG("Skipping compact row with index {}", row.r);
            skipped += row.cells.size();
            continue;
        }
        for (size_t i = 0; i < row.cells.size(); ++i) {
            auto cell = parseCompactTuple(row.r, row.cells[i]);
            if (!cell) {
                INPUT_DEBUG("Skipping malformed tuple #{} in row {} ({} elements)",
                            i, row.r, row.cells[i].size());
                ++skipped;
                continue;
            }
            out.push_back(std::move(*cell));
        }
    }

    if (skipped > 0) {
        INPUT_DEBUG("Sheet '{}': {} compact tuples skipped", meta.name, skipped);
    }
    return build(std::move(out), meta);
}

core::Grid GridNormalizer::fromRows(const std::vector<std::vector<core::CellValue>>& rows,
                                    const SheetMeta& meta, int first_row, int first_col) {
    std::vector<core::GridCell> out;
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t c = 0; c < rows[r].size(); ++c) {
            core::GridCell cell;
            cell.row = first_row + static_cast<int>(r);
            cell.col = first_col + static_cast<int>(c);
            cell.value = rows[r][c];
            out.push_back(std::move(cell));
        }
    }
    return build(std::move(out), meta);
}

core::Grid GridNormalizer::build(std::vector<core::GridCell> cells, const SheetMeta& meta) {
    core::SheetBounds bounds;

    if (meta.bounds) {
        bounds = *meta.bounds;
    } else {
        bool first = true;
        for (const auto& cell : cells) {
            if (!cell.value.isMeaningful()) {
                continue;
            }
            if (first) {
                bounds = core::SheetBounds(cell.row, cell.row, cell.col, cell.lastCol());
                first = false;
            } else {
                bounds.min_row = std::min(bounds.min_row, cell.row);
                bounds.max_row = std::max(bounds.max_row, cell.row);
                bounds.min_col = std::min(bounds.min_col, cell.col);
                bounds.max_col = std::max(bounds.max_col, cell.lastCol());
            }
        }
    }

    core::FrozenPanes frozen = meta.frozen.value_or(core::FrozenPanes());
    core::Grid grid(bounds, std::move(cells), frozen, meta.name, meta.merged_ranges);

    INPUT_DEBUG("Sheet '{}' normalized: {} cells, bounds {}",
                meta.name, grid.cellCount(),
                utils::CommonUtils::rangeReference(bounds.min_row, bounds.min_col,
                                                   bounds.max_row, bounds.max_col));
    return grid;
}

}} // namespace sheetscan::input
