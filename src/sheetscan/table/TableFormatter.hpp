#pragma once

#include <string>
#include <vector>
#include "sheetscan/table/Table.hpp"
#include "sheetscan/table/WorkbookProcessor.hpp"

namespace sheetscan {
namespace table {

/**
 * @brief 表格的纯文本摘要（命令行输出与日志用）
 */
class TableFormatter {
public:
    struct Options {
        size_t max_rows = 20;          // 每个表格最多列出的行标签数，0 表示不限
        bool show_header_context = false;
    };

    TableFormatter() = default;
    explicit TableFormatter(Options options) : options_(options) {}

    std::string format(const Table& table) const;
    std::string formatSheet(const SheetResult& sheet) const;
    std::string formatWorkbook(const std::vector<SheetResult>& sheets) const;

private:
    Options options_;
};

}} // namespace sheetscan::table
