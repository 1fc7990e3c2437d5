#pragma once

#include <map>
#include <string>
#include <vector>
#include "sheetscan/core/CellValue.hpp"

namespace sheetscan {
namespace core {

/**
 * @brief 单个保留单元格
 *
 * run_length > 1 表示从 col 开始的连续 run_length 列共享同一个值（RLE），
 * 只在起始列存一份，不展开。
 */
struct GridCell {
    int row = 0;
    int col = 0;
    CellValue value;
    int run_length = 1;

    bool isRun() const noexcept { return run_length > 1; }
    int lastCol() const noexcept { return run_length > 1 ? col + run_length - 1 : col; }
};

/**
 * @brief 工作表边界（1开始，闭区间）
 */
struct SheetBounds {
    int min_row = 1;
    int max_row = 1;
    int min_col = 1;
    int max_col = 1;

    SheetBounds() = default;
    SheetBounds(int r0, int r1, int c0, int c1)
        : min_row(r0), max_row(r1), min_col(c0), max_col(c1) {}

    bool isValid() const noexcept { return min_row <= max_row && min_col <= max_col; }
    int rowCount() const noexcept { return max_row - min_row + 1; }
    int colCount() const noexcept { return max_col - min_col + 1; }

    bool contains(int row, int col) const noexcept {
        return row >= min_row && row <= max_row && col >= min_col && col <= max_col;
    }

    bool operator==(const SheetBounds& o) const {
        return min_row == o.min_row && max_row == o.max_row &&
               min_col == o.min_col && max_col == o.max_col;
    }
    bool operator!=(const SheetBounds& o) const { return !(*this == o); }
};

/**
 * @brief 冻结窗格提示
 */
struct FrozenPanes {
    int rows = 0;
    int cols = 0;

    FrozenPanes() = default;
    FrozenPanes(int r, int c) : rows(r), cols(c) {}

    bool any() const noexcept { return rows > 0 || cols > 0; }

    bool operator==(const FrozenPanes& o) const { return rows == o.rows && cols == o.cols; }
};

/**
 * @brief 归一化后的稀疏网格
 *
 * 构造后只读。按行、列有序存储，遍历顺序确定。
 */
class Grid {
public:
    using RowMap = std::map<int, GridCell>;

    /**
     * @throws ParameterException 边界 min > max（ErrorCode::InvalidBounds）
     */
    Grid(const SheetBounds& bounds, std::vector<GridCell> cells,
         const FrozenPanes& frozen = FrozenPanes(), std::string name = "",
         std::vector<SheetBounds> merged_ranges = {});

    const SheetBounds& bounds() const noexcept { return bounds_; }
    const FrozenPanes& frozen() const noexcept { return frozen_; }
    const std::string& name() const noexcept { return name_; }
    const std::vector<SheetBounds>& mergedRanges() const noexcept { return merged_ranges_; }

    /**
     * @brief 是否有合并区域与给定矩形相交
     */
    bool hasMergedCellsIn(int start_row, int end_row, int start_col, int end_col) const;

    bool empty() const noexcept { return cell_count_ == 0; }
    size_t cellCount() const noexcept { return cell_count_; }

    /**
     * @brief 精确坐标查找（RLE 只在起始列可见）
     * @return 未保留时返回 nullptr
     */
    const GridCell* find(int row, int col) const;

    bool has(int row, int col) const { return find(row, col) != nullptr; }

    /**
     * @brief 行内保留单元格，按列升序；行不存在时返回空映射
     */
    const RowMap& row(int row) const;

    /**
     * @brief 行内 [min_col, max_col] 的保留单元格，按列升序
     */
    std::vector<const GridCell*> rowCells(int row, int min_col, int max_col) const;

    /**
     * @brief [min_row, max_row] 内有保留单元格（位于 [min_col, max_col]）的行号，升序
     */
    std::vector<int> populatedRows(int min_row, int max_row, int min_col, int max_col) const;

    /**
     * @brief 按行列顺序遍历全部单元格
     */
    const std::map<int, RowMap>& rows() const noexcept { return rows_; }

private:
    SheetBounds bounds_;
    FrozenPanes frozen_;
    std::string name_;
    std::vector<SheetBounds> merged_ranges_;
    std::map<int, RowMap> rows_;
    size_t cell_count_ = 0;
};

}} // namespace sheetscan::core
