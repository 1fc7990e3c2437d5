#pragma once

#include "sheetscan/detection/IDetectionStrategy.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 冻结窗格：有冻结行/列时整张表作为一个区域，优先级最高
 */
class FrozenPaneStrategy : public IDetectionStrategy {
public:
    const char* name() const override { return methods::kFrozenPanes; }

    RegionList detect(const core::Grid& grid,
                      const core::SheetBounds& bounds,
                      const DetectionOptions& options) const override;
};

}} // namespace sheetscan::detection
