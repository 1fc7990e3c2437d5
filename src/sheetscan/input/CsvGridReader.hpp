#pragma once

#include <string>
#include <vector>
#include "sheetscan/core/Grid.hpp"

namespace sheetscan {
namespace input {

struct CsvOptions {
    char delimiter = ',';
    char quote_char = '"';
    bool trim_whitespace = true;
    bool infer_types = true;      // 整数、小数、true/false
};

/**
 * @brief 分隔文本读取器，把 CSV 读成稠密网格
 *
 * 只为命令行工具提供输入，不处理原生电子表格格式。
 */
class CsvGridReader {
public:
    CsvGridReader() = default;
    explicit CsvGridReader(const CsvOptions& options) : options_(options) {}

    void setOptions(const CsvOptions& options) { options_ = options; }
    const CsvOptions& getOptions() const { return options_; }

    /**
     * @brief 解析文本内容为字段矩阵（支持引号内的分隔符、换行和 "" 转义）
     */
    std::vector<std::vector<std::string>> parseString(const std::string& content) const;

    /**
     * @brief 把单个字段推断为单元格值
     */
    core::CellValue inferValue(const std::string& field) const;

    /**
     * @brief 解析文本为网格
     */
    core::Grid readString(const std::string& content, const std::string& sheet_name = "Sheet1") const;

    /**
     * @brief 读取文件为网格，工作表名取文件名（不含扩展名）
     * @throws FileException 文件不存在或不可读
     */
    core::Grid readFile(const std::string& path) const;

private:
    CsvOptions options_;
};

}} // namespace sheetscan::input
