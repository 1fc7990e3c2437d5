#pragma once

#include <string>
#include <vector>
#include "sheetscan/core/Grid.hpp"

namespace sheetscan {
namespace detection {

// detection_method 取值
namespace methods {
constexpr const char* kFrozenPanes = "frozen_panes";
constexpr const char* kFinancialStatement = "financial_statement";
constexpr const char* kBlankRowSeparation = "blank_row_separation";
constexpr const char* kTemporalHeaders = "temporal_headers";
constexpr const char* kColumnContinuity = "column_continuity";
constexpr const char* kMultirowHeaders = "multirow_headers";
constexpr const char* kGaps = "gaps";
constexpr const char* kFormatting = "formatting";
constexpr const char* kContentStructure = "content_structure";
constexpr const char* kDefault = "default";
} // namespace methods

/**
 * @brief 候选表格区域（1开始，闭区间）
 *
 * 只有冻结窗格策略会填写 frozen。
 */
struct Region {
    int start_row = 0;
    int end_row = -1;
    int start_col = 0;
    int end_col = -1;
    std::string detection_method;
    core::FrozenPanes frozen;

    Region() = default;
    Region(int r0, int r1, int c0, int c1, std::string method)
        : start_row(r0), end_row(r1), start_col(c0), end_col(c1),
          detection_method(std::move(method)) {}

    static Region wholeBounds(const core::SheetBounds& b, std::string method) {
        return Region(b.min_row, b.max_row, b.min_col, b.max_col, std::move(method));
    }

    bool isValid() const noexcept { return start_row <= end_row && start_col <= end_col; }
    int rowCount() const noexcept { return isValid() ? end_row - start_row + 1 : 0; }
    int colCount() const noexcept { return isValid() ? end_col - start_col + 1 : 0; }

    bool contains(int row, int col) const noexcept {
        return row >= start_row && row <= end_row && col >= start_col && col <= end_col;
    }

    /**
     * @brief "A1:C5" 形式的范围引用
     */
    std::string toReference() const;

    bool operator==(const Region& o) const {
        return start_row == o.start_row && end_row == o.end_row &&
               start_col == o.start_col && end_col == o.end_col &&
               detection_method == o.detection_method && frozen == o.frozen;
    }
    bool operator!=(const Region& o) const { return !(*this == o); }
};

using RegionList = std::vector<Region>;

}} // namespace sheetscan::detection
