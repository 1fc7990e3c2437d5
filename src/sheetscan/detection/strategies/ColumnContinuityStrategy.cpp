#include "sheetscan/detection/strategies/ColumnContinuityStrategy.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <cmath>
#include <cstdlib>

namespace sheetscan {
namespace detection {

bool ColumnContinuityStrategy::isSignificantChange(const ColumnPattern& prev, const ColumnPattern& next) {
    if (std::abs(prev.col_count - next.col_count) > DetectionConstants::kContinuityColCountDelta) {
        return true;
    }
    if (std::fabs(prev.numeric_ratio - next.numeric_ratio) > DetectionConstants::kContinuityNumericDelta) {
        return true;
    }
    if (std::abs(prev.column_span - next.column_span) > DetectionConstants::kContinuitySpanDelta) {
        return true;
    }
    return std::fabs(prev.density - next.density) > DetectionConstants::kContinuityDensityDelta;
}

RegionList ColumnContinuityStrategy::detect(const core::Grid& grid,
                                            const core::SheetBounds& bounds,
                                            const DetectionOptions& /*options*/) const {
    const std::vector<int> rows = RowAnalysis::dataRows(grid, bounds);
    if (static_cast<int>(rows.size()) < DetectionConstants::kMinRowsForContinuity) {
        return {};
    }

    std::vector<ColumnPattern> patterns;
    patterns.reserve(rows.size());
    for (int row : rows) {
        patterns.push_back(RowAnalysis::columnPattern(grid, row, bounds.min_col, bounds.max_col));
    }

    // 段 = rows 中的 [first, last] 下标
    std::vector<std::pair<size_t, size_t>> segments;
    size_t seg_start = 0;
    for (size_t i = 1; i < rows.size(); ++i) {
        if (isSignificantChange(patterns[i - 1], patterns[i])) {
            segments.emplace_back(seg_start, i - 1);
            seg_start = i;
        }
    }
    segments.emplace_back(seg_start, rows.size() - 1);

    // 后面紧跟更"数值化"段的短文本段是该段的表头带，并入后一段
    std::vector<std::pair<size_t, size_t>> merged;
    for (size_t s = 0; s < segments.size(); ++s) {
        auto seg = segments[s];
        const size_t seg_rows = seg.second - seg.first + 1;
        if (s + 1 < segments.size() &&
            static_cast<int>(seg_rows) <= DetectionConstants::kMaxHeaderBandRows &&
            patterns[seg.second].numeric_ratio < patterns[segments[s + 1].first].numeric_ratio) {
            segments[s + 1].first = seg.first;
            continue;
        }
        merged.push_back(seg);
    }

    if (merged.size() < 2) {
        return {};
    }

    RegionList regions;
    for (const auto& seg : merged) {
        regions.emplace_back(rows[seg.first], rows[seg.second], bounds.min_col, bounds.max_col, name());
    }
    DETECT_DEBUG("Column continuity found {} tables", regions.size());
    return regions;
}

}} // namespace sheetscan::detection
