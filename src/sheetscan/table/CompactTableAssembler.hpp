#pragma once

#include <string>
#include "sheetscan/core/Grid.hpp"
#include "sheetscan/detection/Region.hpp"
#include "sheetscan/headers/HeaderResolver.hpp"
#include "sheetscan/table/Table.hpp"
#include "sheetscan/table/TitleDetector.hpp"

namespace sheetscan {
namespace table {

/**
 * @brief 紧凑模式表格组装
 *
 * 先做标题检测（可能使区域首行下移），再在调整后的区域上解析表头；
 * 列/行只保留标签和单元格数量。
 */
class CompactTableAssembler {
public:
    Table assemble(const core::Grid& grid, const detection::Region& region, const std::string& id) const;

private:
    TitleDetector title_detector_;
    headers::HeaderResolver resolver_;
};

}} // namespace sheetscan::table
