#include "sheetscan/detection/strategies/ContentStructureStrategy.hpp"
#include "sheetscan/detection/RowAnalysis.hpp"

namespace sheetscan {
namespace detection {

RegionList ContentStructureStrategy::detect(const core::Grid& grid,
                                            const core::SheetBounds& bounds,
                                            const DetectionOptions& /*options*/) const {
    const int data_rows = static_cast<int>(RowAnalysis::dataRows(grid, bounds).size());
    if (data_rows < DetectionConstants::kStructureMinRows) {
        return {};
    }

    int data_cols = 0;
    for (int col = bounds.min_col; col <= bounds.max_col; ++col) {
        if (RowAnalysis::colHasData(grid, col, bounds.min_row, bounds.max_row)) {
            if (++data_cols >= DetectionConstants::kStructureMinCols) {
                return {Region::wholeBounds(bounds, name())};
            }
        }
    }
    return {};
}

}} // namespace sheetscan::detection
