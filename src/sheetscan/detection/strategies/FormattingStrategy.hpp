#pragma once

#include "sheetscan/detection/IDetectionStrategy.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 按格式检测的占位策略，目前总是返回空
 */
class FormattingStrategy : public IDetectionStrategy {
public:
    const char* name() const override { return methods::kFormatting; }

    RegionList detect(const core::Grid& grid,
                      const core::SheetBounds& bounds,
                      const DetectionOptions& options) const override;
};

}} // namespace sheetscan::detection
