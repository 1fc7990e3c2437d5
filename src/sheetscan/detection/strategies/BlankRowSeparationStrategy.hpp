#pragma once

#include <vector>
#include "sheetscan/detection/IDetectionStrategy.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 空行分隔：按空行间隔和前后行模式切分多个表
 */
class BlankRowSeparationStrategy : public IDetectionStrategy {
public:
    const char* name() const override { return methods::kBlankRowSeparation; }

    RegionList detect(const core::Grid& grid,
                      const core::SheetBounds& bounds,
                      const DetectionOptions& options) const override;

    /**
     * @brief 间隔后是否为同一表内的节标题（间隔后一行只有首列文本，再下一行延续间隔前的形状）
     */
    static bool isSectionHeaderWithinTable(const core::Grid& grid, const std::vector<int>& rows,
                                           size_t index, int min_col, int max_col);

    /**
     * @brief 间隔前后行的模式是否有实质差异
     */
    static bool isPatternChange(const core::Grid& grid, int prev_row, int next_row,
                                int min_col, int max_col);
};

}} // namespace sheetscan::detection
