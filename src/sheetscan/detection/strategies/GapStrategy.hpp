#pragma once

#include "sheetscan/detection/IDetectionStrategy.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 固定阈值空行分割，仅在 use_gaps 打开时生效
 */
class GapStrategy : public IDetectionStrategy {
public:
    const char* name() const override { return methods::kGaps; }

    RegionList detect(const core::Grid& grid,
                      const core::SheetBounds& bounds,
                      const DetectionOptions& options) const override;
};

}} // namespace sheetscan::detection
