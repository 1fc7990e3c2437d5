#pragma once

#include "sheetscan/detection/IDetectionStrategy.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 多行表头块：连续 >= 2 个表头样式行开始一个表
 */
class MultiRowHeaderStrategy : public IDetectionStrategy {
public:
    const char* name() const override { return methods::kMultirowHeaders; }

    RegionList detect(const core::Grid& grid,
                      const core::SheetBounds& bounds,
                      const DetectionOptions& options) const override;
};

}} // namespace sheetscan::detection
