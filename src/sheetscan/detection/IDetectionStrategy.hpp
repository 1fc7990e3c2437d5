#pragma once

#include "sheetscan/core/Grid.hpp"
#include "sheetscan/detection/DetectionOptions.hpp"
#include "sheetscan/detection/Region.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 区域检测策略接口
 *
 * 实现必须无状态：同一个对象可在多个线程上并发调用 detect。
 * 返回空列表表示"不匹配"，由 TableDetector 继续尝试下一个策略。
 */
class IDetectionStrategy {
public:
    virtual ~IDetectionStrategy() = default;

    /**
     * @brief 策略名，同时作为 Region::detection_method
     */
    virtual const char* name() const = 0;

    virtual RegionList detect(const core::Grid& grid,
                              const core::SheetBounds& bounds,
                              const DetectionOptions& options) const = 0;
};

}} // namespace sheetscan::detection
