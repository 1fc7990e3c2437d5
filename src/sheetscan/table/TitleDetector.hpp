#pragma once

#include <optional>
#include <string>
#include "sheetscan/core/Grid.hpp"
#include "sheetscan/detection/Region.hpp"

namespace sheetscan {
namespace table {

/**
 * @brief 标题检测结果
 *
 * region 为调整后的区域：标题位于区域首行时起始行下移一行。
 */
struct TitleResult {
    std::optional<std::string> title;
    detection::Region region;
    bool shifted = false;
};

/**
 * @brief 紧凑模式的表格标题检测
 *
 * 依次检查区域上一行（在工作表内时）和区域首行。标题行在区域列范围内
 * 只有一个单元格，位于最左列且为文本。
 */
class TitleDetector {
public:
    static constexpr size_t kMinTitleLength = 3;
    static constexpr size_t kMaxTitleLength = 100;

    TitleResult detect(const core::Grid& grid, const detection::Region& region) const;

    /**
     * @brief 文本是否像标题
     *
     * 3~100 字符，至少一个字母，不是纯数字/标点，
     * 不含独立的年份（20xx）或月份词。
     */
    static bool isTitleText(const std::string& text);

private:
    std::optional<std::string> titleAt(const core::Grid& grid, int row, int start_col, int end_col) const;
};

}} // namespace sheetscan::table
