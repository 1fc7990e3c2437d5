#pragma once

#include <optional>
#include <string>
#include <vector>
#include "sheetscan/core/Grid.hpp"
#include "sheetscan/headers/HeaderResolver.hpp"

namespace sheetscan {
namespace headers {

/**
 * @brief 数据单元格的表头上下文（详细模式）
 *
 * column_path: 该列在各表头行的值，自上而下（最外层在前）
 * row_path:    该行在各表头列的值，自左而右
 *
 * primary_* 取路径的 front()，即最外层表头（如 "2023"）。
 * 详细列标签的顺序相反，最细的一级在前（"Jan 2023"）。
 */
struct HeaderContext {
    std::vector<std::string> column_path;
    std::vector<std::string> row_path;
    std::optional<std::string> primary_column_header;
    std::optional<std::string> primary_row_header;
    int column_levels = 0;
    int row_levels = 0;

    bool operator==(const HeaderContext& o) const {
        return column_path == o.column_path && row_path == o.row_path &&
               primary_column_header == o.primary_column_header &&
               primary_row_header == o.primary_row_header &&
               column_levels == o.column_levels && row_levels == o.row_levels;
    }
};

/**
 * @brief 为 (row, col) 构建表头上下文；缺失的表头值不计入路径
 */
HeaderContext buildHeaderContext(const core::Grid& grid, const HeaderInfo& info, int row, int col);

}} // namespace sheetscan::headers
