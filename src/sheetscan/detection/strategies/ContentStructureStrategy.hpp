#pragma once

#include "sheetscan/detection/IDetectionStrategy.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 内容结构兜底：>= 3 行且 >= 2 列时整张表作为一个区域
 */
class ContentStructureStrategy : public IDetectionStrategy {
public:
    const char* name() const override { return methods::kContentStructure; }

    RegionList detect(const core::Grid& grid,
                      const core::SheetBounds& bounds,
                      const DetectionOptions& options) const override;
};

}} // namespace sheetscan::detection
