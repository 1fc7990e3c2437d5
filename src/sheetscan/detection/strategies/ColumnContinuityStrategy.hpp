#pragma once

#include "sheetscan/detection/IDetectionStrategy.hpp"
#include "sheetscan/detection/RowAnalysis.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 列连续性：相邻数据行形状签名突变处切分
 */
class ColumnContinuityStrategy : public IDetectionStrategy {
public:
    const char* name() const override { return methods::kColumnContinuity; }

    RegionList detect(const core::Grid& grid,
                      const core::SheetBounds& bounds,
                      const DetectionOptions& options) const override;

    static bool isSignificantChange(const ColumnPattern& prev, const ColumnPattern& next);
};

}} // namespace sheetscan::detection
