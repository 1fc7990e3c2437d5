#pragma once

#include <string>
#include "sheetscan/core/Grid.hpp"
#include "sheetscan/detection/Region.hpp"
#include "sheetscan/headers/HeaderResolver.hpp"
#include "sheetscan/table/Table.hpp"

namespace sheetscan {
namespace table {

/**
 * @brief 详细模式表格组装
 *
 * 每个区域列/行生成一个 Column/Row，携带区域内的完整单元格；
 * 数据区单元格附带表头上下文。
 */
class VerboseTableAssembler {
public:
    Table assemble(const core::Grid& grid, const detection::Region& region, const std::string& id) const;

private:
    headers::HeaderResolver resolver_;
};

}} // namespace sheetscan::table
