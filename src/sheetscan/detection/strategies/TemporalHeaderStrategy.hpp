#pragma once

#include "sheetscan/detection/IDetectionStrategy.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 时间表头：前 5 行中的日期/月份行各自开始一个表
 */
class TemporalHeaderStrategy : public IDetectionStrategy {
public:
    const char* name() const override { return methods::kTemporalHeaders; }

    RegionList detect(const core::Grid& grid,
                      const core::SheetBounds& bounds,
                      const DetectionOptions& options) const override;

    static int findTableEnd(const core::Grid& grid, int header_row, const core::SheetBounds& bounds);
};

}} // namespace sheetscan::detection
