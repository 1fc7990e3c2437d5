#include "sheetscan/detection/strategies/FormattingStrategy.hpp"

namespace sheetscan {
namespace detection {

// 网格里没有样式信息，保留在链中等待样式数据接入
RegionList FormattingStrategy::detect(const core::Grid& /*grid*/,
                                      const core::SheetBounds& /*bounds*/,
                                      const DetectionOptions& /*options*/) const {
    return {};
}

}} // namespace sheetscan::detection
