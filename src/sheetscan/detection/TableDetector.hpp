#pragma once

#include <memory>
#include <string>
#include <vector>
#include "sheetscan/detection/IDetectionStrategy.hpp"
#include "sheetscan/detection/RegionValidator.hpp"

namespace sheetscan {
namespace detection {

/**
 * @brief 表格区域检测器
 *
 * 按固定优先级依次尝试策略，第一个返回非空结果的策略胜出，
 * 不同策略的结果从不合并。胜出结果经 RegionValidator 裁剪后返回。
 *
 * 默认链：frozen_panes → financial_statement → blank_row_separation →
 * temporal_headers → column_continuity → multirow_headers → gaps →
 * formatting → content_structure → default
 */
class TableDetector {
public:
    using StrategyList = std::vector<std::unique_ptr<IDetectionStrategy>>;

    TableDetector();
    explicit TableDetector(StrategyList strategies);

    TableDetector(const TableDetector&) = delete;
    TableDetector& operator=(const TableDetector&) = delete;
    TableDetector(TableDetector&&) = default;
    TableDetector& operator=(TableDetector&&) = default;

    /**
     * @brief 检测一张工作表的表格区域
     * @return 检测顺序的区域列表；只有空网格会返回空列表
     */
    RegionList detect(const core::Grid& grid, const DetectionOptions& options) const;

    std::vector<std::string> strategyNames() const;

    static StrategyList defaultStrategies();

private:
    StrategyList strategies_;
    RegionValidator validator_;
};

}} // namespace sheetscan::detection
