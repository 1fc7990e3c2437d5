#pragma once

#include <vector>
#include "sheetscan/core/Grid.hpp"
#include "sheetscan/detection/Region.hpp"

namespace sheetscan {
namespace headers {

/**
 * @brief 区域的表头行/列与数据起点
 *
 * header_rows/header_columns 均位于所属区域内；
 * data_start = 区域起点 + 该方向表头数量。
 */
struct HeaderInfo {
    std::vector<int> header_rows;
    std::vector<int> header_columns;
    int data_start_row = 0;
    int data_start_col = 0;

    bool isHeaderRow(int row) const;
    bool isHeaderColumn(int col) const;

    bool operator==(const HeaderInfo& o) const {
        return header_rows == o.header_rows && header_columns == o.header_columns &&
               data_start_row == o.data_start_row && data_start_col == o.data_start_col;
    }
    bool operator!=(const HeaderInfo& o) const { return !(*this == o); }
};

/**
 * @brief 表头解析器
 *
 * 有冻结提示时取区域前 frozen_rows 行 / frozen_cols 列（裁剪到区域内）；
 * 否则区域在该方向多于一行/列时取第一行/列作为唯一表头。
 */
class HeaderResolver {
public:
    HeaderInfo resolve(const detection::Region& region, const core::FrozenPanes& frozen) const;
};

}} // namespace sheetscan::headers
