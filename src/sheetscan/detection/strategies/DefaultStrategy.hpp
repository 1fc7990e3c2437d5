#pragma once

#include "sheetscan/detection/IDetectionStrategy.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 最终兜底：网格非空时整张表作为一个区域
 */
class DefaultStrategy : public IDetectionStrategy {
public:
    const char* name() const override { return methods::kDefault; }

    RegionList detect(const core::Grid& grid,
                      const core::SheetBounds& bounds,
                      const DetectionOptions& options) const override;
};

}} // namespace sheetscan::detection
