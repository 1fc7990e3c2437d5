#include "sheetscan/detection/strategies/GapStrategy.hpp"
#include "sheetscan/detection/RowAnalysis.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

namespace sheetscan {
namespace detection {

RegionList GapStrategy::detect(const core::Grid& grid,
                               const core::SheetBounds& bounds,
                               const DetectionOptions& options) const {
    if (!options.use_gaps) {
        return {};
    }

    const std::vector<int> rows = RowAnalysis::dataRows(grid, bounds);
    if (rows.size() < 2) {
        return {};
    }

    RegionList regions;
    int current_start = rows.front();
    for (size_t i = 1; i < rows.size(); ++i) {
        const int gap = rows[i] - rows[i - 1] - 1;
        if (gap >= options.gap_threshold) {
            regions.emplace_back(current_start, rows[i - 1], bounds.min_col, bounds.max_col, name());
            current_start = rows[i];
        }
    }
    regions.emplace_back(current_start, rows.back(), bounds.min_col, bounds.max_col, name());

    DETECT_DEBUG("Gap split (threshold {}) found {} tables", options.gap_threshold, regions.size());
    return regions;
}

}} // namespace sheetscan::detection
