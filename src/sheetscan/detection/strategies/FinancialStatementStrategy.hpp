#pragma once

#include <string>
#include "sheetscan/detection/IDetectionStrategy.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 财务报表布局：首列节标题 + 多列数据行
 */
class FinancialStatementStrategy : public IDetectionStrategy {
public:
    const char* name() const override { return methods::kFinancialStatement; }

    RegionList detect(const core::Grid& grid,
                      const core::SheetBounds& bounds,
                      const DetectionOptions& options) const override;

    static bool containsFinancialTerm(const std::string& text);
};

}} // namespace sheetscan::detection
