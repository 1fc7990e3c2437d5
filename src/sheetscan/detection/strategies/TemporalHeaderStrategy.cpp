#include "sheetscan/detection/strategies/TemporalHeaderStrategy.hpp"
#include "sheetscan/detection/RowAnalysis.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <algorithm>

namespace sheetscan {
namespace detection {

int TemporalHeaderStrategy::findTableEnd(const core::Grid& grid, int header_row,
                                         const core::SheetBounds& bounds) {
    int last_data_row = header_row;

    for (int row = header_row + 1; row <= bounds.max_row; ++row) {
        if (RowAnalysis::rowHasData(grid, row, bounds.min_col, bounds.max_col)) {
            if (RowAnalysis::isTemporalRow(grid, row, bounds.min_col, bounds.max_col)) {
                break;  // 下一个时间表头开始新表
            }
            last_data_row = row;
            continue;
        }

        auto next = RowAnalysis::nextDataRow(grid, row + 1, bounds.max_row, bounds.min_col, bounds.max_col);
        if (!next || *next - row > 1) {
            break;  // 连续 >= 2 个空行，或后面没有数据
        }
    }
    return last_data_row;
}

RegionList TemporalHeaderStrategy::detect(const core::Grid& grid,
                                          const core::SheetBounds& bounds,
                                          const DetectionOptions& /*options*/) const {
    const int scan_end = std::min(bounds.min_row + DetectionConstants::kTemporalScanRows - 1, bounds.max_row);

    RegionList regions;
    for (int row = bounds.min_row; row <= scan_end; ++row) {
        if (!RowAnalysis::isTemporalRow(grid, row, bounds.min_col, bounds.max_col)) {
            continue;
        }
        const int end_row = findTableEnd(grid, row, bounds);
        if (end_row > row) {
            regions.emplace_back(row, end_row, bounds.min_col, bounds.max_col, name());
        }
    }

    if (!regions.empty()) {
        DETECT_DEBUG("Temporal headers found {} tables", regions.size());
    }
    return regions;
}

}} // namespace sheetscan::detection
