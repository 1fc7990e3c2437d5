#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "sheetscan/core/Grid.hpp"

namespace sheetscan {
namespace input {

/**
 * @brief 工作表级元信息（由外部提取器给出）
 */
struct SheetMeta {
    std::string name;
    std::optional<core::SheetBounds> bounds;     // 未给出时从保留单元格推导
    std::optional<core::FrozenPanes> frozen;
    std::vector<core::SheetBounds> merged_ranges;
};

/**
 * @brief 坐标键格式的单元格记录，row/column 缺省时从 "A1" 键解析
 */
struct DenseCellRecord {
    core::CellValue value;
    std::optional<int> row;
    std::optional<int> column;

    DenseCellRecord() = default;
    DenseCellRecord(core::CellValue v) : value(std::move(v)) {}
    DenseCellRecord(core::CellValue v, int r, int c) : value(std::move(v)), row(r), column(c) {}
};

using DenseCellMap = std::map<std::string, DenseCellRecord>;

/**
 * @brief 紧凑格式单元格元组: [col, value, style?, formula?, runLength?]
 */
using CompactTuple = std::vector<core::CellValue>;

/**
 * @brief 紧凑格式行记录 {r, cells}
 */
struct CompactRow {
    int r = 0;
    std::vector<CompactTuple> cells;
};

/**
 * @brief 网格归一化器
 *
 * 两种输入表示收敛到同一个 core::Grid，下游不再区分来源。
 * 单个坏元组只跳过该单元格，不会让整张表失败。
 */
class GridNormalizer {
public:
    /**
     * @brief 从坐标键映射构建网格
     * @throws ParameterException 给出的边界 min > max
     */
    static core::Grid fromDense(const DenseCellMap& cells, const SheetMeta& meta = SheetMeta());

    /**
     * @brief 从紧凑行记录构建网格，识别 RLE 元组
     * @throws ParameterException 给出的边界 min > max
     */
    static core::Grid fromCompact(const std::vector<CompactRow>& rows, const SheetMeta& meta = SheetMeta());

    /**
     * @brief 从二维值数组构建网格（CSV 读取与测试使用）
     * @param first_row rows[0] 对应的行号
     * @param first_col rows[i][0] 对应的列号
     */
    static core::Grid fromRows(const std::vector<std::vector<core::CellValue>>& rows,
                               const SheetMeta& meta = SheetMeta(),
                               int first_row = 1, int first_col = 1);

    /**
     * @brief 解析一个紧凑元组
     * @return 元组非法时返回空
     */
    static std::optional<core::GridCell> parseCompactTuple(int row, const CompactTuple& tuple);

private:
    static core::Grid build(std::vector<core::GridCell> cells, const SheetMeta& meta);
};

}} // namespace sheetscan::input
