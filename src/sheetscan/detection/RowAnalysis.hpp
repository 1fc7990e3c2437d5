#pragma once

#include <optional>
#include <string>
#include <vector>
#include "sheetscan/core/Grid.hpp"

namespace sheetscan {
namespace detection {

// 检测阈值集中定义
struct DetectionConstants {
    // 空行分隔
    static constexpr int kHardGapRows = 4;             // 空行数 >= 4 必为边界
    static constexpr int kMinRowsForSeparation = 4;
    static constexpr int kMaxColCountDelta = 2;        // 列数差 > 2 视为形状变化

    // 时间表头
    static constexpr int kTemporalScanRows = 5;
    static constexpr double kTemporalMinRatio = 0.25;

    // 列连续性
    static constexpr int kMinRowsForContinuity = 3;
    static constexpr int kContinuityColCountDelta = 5;
    static constexpr double kContinuityNumericDelta = 0.4;
    static constexpr int kContinuitySpanDelta = 10;
    static constexpr double kContinuityDensityDelta = 0.3;
    static constexpr int kMaxHeaderBandRows = 3;

    // 多行表头
    static constexpr int kMultirowScanExtraRows = 10;  // 扫描 min_row .. min_row + 10
    static constexpr int kMultirowMinBlockRows = 2;
    static constexpr int kMultirowMinColumns = 3;
    static constexpr int kMultirowLookaheadRows = 3;
    static constexpr int kMultirowMaxGap = 2;

    // 财务报表
    static constexpr int kFinancialMinSections = 2;
    static constexpr int kFinancialMinDataRows = 3;
    static constexpr int kFinancialMinOtherCells = 3;  // 数据行除首列外 > 2 个单元格
    static constexpr double kFinancialTermRatio = 0.6;

    // 内容结构兜底
    static constexpr int kStructureMinRows = 3;
    static constexpr int kStructureMinCols = 2;

    // 文本标签：长度 > 3 的非数字字符串，行内 > 2 个
    static constexpr size_t kTextLabelMinLength = 4;
    static constexpr int kTextLabelMinCount = 3;
};

/**
 * @brief 行内容模式（空行分隔与多行表头使用）
 */
struct RowContentPattern {
    int col_count = 0;
    bool mostly_numeric = false;
    bool has_text_labels = false;

    bool isHeaderLike() const noexcept { return has_text_labels && !mostly_numeric; }
};

/**
 * @brief 行形状签名（列连续性使用）
 */
struct ColumnPattern {
    int col_count = 0;
    double numeric_ratio = 0.0;
    double text_ratio = 0.0;
    int column_span = 0;
    double density = 0.0;
};

/**
 * @brief 各检测策略共用的行分析函数
 *
 * 出现性判断只看单元格所在的起始列，RLE 游程不展开。
 */
class RowAnalysis {
public:
    static bool rowHasData(const core::Grid& grid, int row, int min_col, int max_col);
    static bool colHasData(const core::Grid& grid, int col, int min_row, int max_row);

    /**
     * @brief 边界内所有有数据的行，升序
     */
    static std::vector<int> dataRows(const core::Grid& grid, const core::SheetBounds& bounds);

    static std::optional<int> nextDataRow(const core::Grid& grid, int start_row, int max_row,
                                          int min_col, int max_col);

    /**
     * @brief 行号区间内有数据的列的最小/最大值；无数据时返回 fallback
     */
    static std::pair<int, int> dataColumnRange(const core::Grid& grid, int start_row, int end_row,
                                               int min_col, int max_col);

    static RowContentPattern contentPattern(const core::Grid& grid, int row, int min_col, int max_col);
    static ColumnPattern columnPattern(const core::Grid& grid, int row, int min_col, int max_col);

    /**
     * @brief 行模式用的数值判断：数值、布尔，或去掉 '.' '-' 后全为数字的字符串
     */
    static bool isNumericLike(const core::CellValue& value);

    /**
     * @brief 去掉 , $ % 空格后可解析为浮点数
     */
    static bool isNumericString(const std::string& value);

    /**
     * @brief 非数字文本（字符串且不满足 isNumericString）
     */
    static bool isText(const core::CellValue& value);

    /**
     * @brief ISO 日期 20YY-MM-DD 或 "Month N"（不区分大小写）
     */
    static bool isTemporalText(const std::string& text);

    /**
     * @brief isTemporalText 之外再接受 "Jan 2024"、"March 2023"、"Q1 2024" 形式
     */
    static bool isDateHeaderText(const std::string& text);

    /**
     * @brief 行内非标签单元格中，满足 matcher 的比例是否 >= 25%
     *
     * 行有其他单元格时，首列的文本单元格视为行标签，不参与统计。
     */
    static bool isTemporalRow(const core::Grid& grid, int row, int min_col, int max_col);
    static bool isDateHeaderRow(const core::Grid& grid, int row, int min_col, int max_col);

    /**
     * @brief 节标题行：首列为文本且行内没有其他单元格
     */
    static bool isSectionHeaderRow(const core::Grid& grid, int row, int min_col, int max_col);

private:
    template<typename Matcher>
    static bool matchesTemporalRatio(const core::Grid& grid, int row, int min_col, int max_col,
                                     Matcher&& matcher);
};

}} // namespace sheetscan::detection
