#include "sheetscan/detection/strategies/BlankRowSeparationStrategy.hpp"
#include "sheetscan/detection/RowAnalysis.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <cstdlib>

namespace sheetscan {
namespace detection {

bool BlankRowSeparationStrategy::isPatternChange(const core::Grid& grid, int prev_row, int next_row,
                                                 int min_col, int max_col) {
    const RowContentPattern prev = RowAnalysis::contentPattern(grid, prev_row, min_col, max_col);
    const RowContentPattern next = RowAnalysis::contentPattern(grid, next_row, min_col, max_col);

    if (std::abs(prev.col_count - next.col_count) > DetectionConstants::kMaxColCountDelta) {
        return true;
    }
    if (prev.mostly_numeric != next.mostly_numeric) {
        return true;
    }
    return next.has_text_labels && !prev.has_text_labels;
}

bool BlankRowSeparationStrategy::isSectionHeaderWithinTable(const core::Grid& grid,
                                                            const std::vector<int>& rows,
                                                            size_t index, int min_col, int max_col) {
    if (index == 0 || index + 1 >= rows.size()) {
        return false;
    }
    if (!RowAnalysis::isSectionHeaderRow(grid, rows[index], min_col, max_col)) {
        return false;
    }

    const RowContentPattern before = RowAnalysis::contentPattern(grid, rows[index - 1], min_col, max_col);
    const RowContentPattern after = RowAnalysis::contentPattern(grid, rows[index + 1], min_col, max_col);
    return std::abs(before.col_count - after.col_count) <= DetectionConstants::kMaxColCountDelta &&
           before.mostly_numeric == after.mostly_numeric;
}

RegionList BlankRowSeparationStrategy::detect(const core::Grid& grid,
                                              const core::SheetBounds& bounds,
                                              const DetectionOptions& /*options*/) const {
    const std::vector<int> rows = RowAnalysis::dataRows(grid, bounds);
    if (static_cast<int>(rows.size()) < DetectionConstants::kMinRowsForSeparation) {
        return {};
    }

    // 每个表起始行在 rows 中的下标
    std::vector<size_t> starts{0};

    for (size_t i = 1; i < rows.size(); ++i) {
        const int gap = rows[i] - rows[i - 1] - 1;
        if (gap <= 0) {
            continue;
        }

        bool boundary = false;
        if (gap >= DetectionConstants::kHardGapRows) {
            boundary = true;
        } else if (RowAnalysis::isDateHeaderRow(grid, rows[i], bounds.min_col, bounds.max_col)) {
            // 日期表头总是开始新表，即使看起来像节标题
            boundary = true;
        } else if (isSectionHeaderWithinTable(grid, rows, i, bounds.min_col, bounds.max_col)) {
            boundary = false;
        } else {
            boundary = isPatternChange(grid, rows[i - 1], rows[i], bounds.min_col, bounds.max_col);
        }

        if (boundary) {
            starts.push_back(i);
        }
    }

    if (starts.size() < 2) {
        return {};
    }

    RegionList regions;
    for (size_t t = 0; t < starts.size(); ++t) {
        const size_t first = starts[t];
        const size_t last = (t + 1 < starts.size()) ? starts[t + 1] - 1 : rows.size() - 1;
        const int start_row = rows[first];
        const int end_row = rows[last];

        auto [start_col, end_col] = RowAnalysis::dataColumnRange(grid, start_row, end_row,
                                                                 bounds.min_col, bounds.max_col);
        regions.emplace_back(start_row, end_row, start_col, end_col, name());
    }

    DETECT_DEBUG("Blank-row separation found {} tables", regions.size());
    return regions;
}

}} // namespace sheetscan::detection
