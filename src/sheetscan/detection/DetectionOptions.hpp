#pragma once

#include <map>
#include <optional>
#include <string>
#include "sheetscan/core/Grid.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 区域检测配置
 *
 * 识别的键：
 * - table_detection.use_gaps                     bool，默认 false
 * - table_detection.gap_threshold                int，默认 3（通用 Gaps 策略）
 * - compact.table_detection.gap_threshold        int，默认 2（紧凑流程的简化分割）
 * - sheet_data.frozen / sheet_data.frozen_panes  "rows,cols"
 * - sheet_data.frozen_panes.frozen_rows / .frozen_cols
 *
 * 配置里的冻结窗格优先于网格自带的提示。
 */
struct DetectionOptions {
    static constexpr int kDefaultGapThreshold = 3;
    static constexpr int kDefaultCompactGapThreshold = 2;

    bool use_gaps = false;
    int gap_threshold = kDefaultGapThreshold;
    int compact_gap_threshold = kDefaultCompactGapThreshold;
    std::optional<core::FrozenPanes> frozen;

    /**
     * @brief 解析点分键值配置
     *
     * 未知键记录警告后忽略。
     * @throws ParameterException 值格式非法（ErrorCode::InvalidConfiguration）
     */
    static DetectionOptions fromKeyValues(const std::map<std::string, std::string>& values);

    /**
     * @throws ParameterException 阈值 < 1 或冻结行列为负
     */
    void validate() const;

    /**
     * @brief 紧凑流程使用的配置副本：Gaps 策略改用 compact_gap_threshold
     */
    DetectionOptions forCompact() const {
        DetectionOptions copy(*this);
        copy.gap_threshold = compact_gap_threshold;
        return copy;
    }

    /**
     * @brief 本次检测实际生效的冻结窗格（配置优先，其次网格）
     */
    core::FrozenPanes effectiveFrozen(const core::Grid& grid) const {
        return frozen ? *frozen : grid.frozen();
    }
};

}} // namespace sheetscan::detection
