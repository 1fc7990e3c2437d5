#pragma once

#include "sheetscan/detection/Region.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 区域校验：裁剪到工作表边界，丢弃空区域，保持顺序
 */
class RegionValidator {
public:
    RegionList validate(const RegionList& regions, const core::SheetBounds& bounds) const;

    /**
     * @brief 裁剪单个区域，结果可能为空（!isValid()）
     */
    static Region clip(const Region& region, const core::SheetBounds& bounds);
};

}} // namespace sheetscan::detection
