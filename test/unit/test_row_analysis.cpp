#include <gtest/gtest.h>
#include "sheetscan/detection/RowAnalysis.hpp"
#include "GridFixtures.hpp"

using namespace sheetscan;
using detection::RowAnalysis;

// 测试行模式的数值判断
TEST(RowAnalysisTest, NumericLike) {
    EXPECT_TRUE(RowAnalysis::isNumericLike(core::CellValue(3)));
    EXPECT_TRUE(RowAnalysis::isNumericLike(core::CellValue(true)));
    EXPECT_TRUE(RowAnalysis::isNumericLike(core::CellValue("2024-01-05")));
    EXPECT_TRUE(RowAnalysis::isNumericLike(core::CellValue("-1.5")));
    EXPECT_FALSE(RowAnalysis::isNumericLike(core::CellValue("$1,000")));
    EXPECT_FALSE(RowAnalysis::isNumericLike(core::CellValue("--")));
}

// 测试列连续性使用的数字字符串判断
TEST(RowAnalysisTest, NumericString) {
    EXPECT_TRUE(RowAnalysis::isNumericString("$1,000"));
    EXPECT_TRUE(RowAnalysis::isNumericString("12.5 %"));
    EXPECT_FALSE(RowAnalysis::isNumericString("Q1"));
    EXPECT_FALSE(RowAnalysis::isNumericString(""));

    EXPECT_TRUE(RowAnalysis::isText(core::CellValue("Revenue")));
    EXPECT_FALSE(RowAnalysis::isText(core::CellValue("1,200")));
    EXPECT_FALSE(RowAnalysis::isText(core::CellValue(5)));
}

// 测试时间文本
TEST(RowAnalysisTest, TemporalText) {
    EXPECT_TRUE(RowAnalysis::isTemporalText("2024-03-31"));
    EXPECT_TRUE(RowAnalysis::isTemporalText("Month 3"));
    EXPECT_TRUE(RowAnalysis::isTemporalText("month   12"));
    EXPECT_FALSE(RowAnalysis::isTemporalText("Jan 2024"));
    EXPECT_FALSE(RowAnalysis::isTemporalText("1999-03-31"));

    EXPECT_TRUE(RowAnalysis::isDateHeaderText("Jan 2024"));
    EXPECT_TRUE(RowAnalysis::isDateHeaderText("September 2023"));
    EXPECT_TRUE(RowAnalysis::isDateHeaderText("Q3 2024"));
    EXPECT_FALSE(RowAnalysis::isDateHeaderText("Marketing 2023"));
    EXPECT_FALSE(RowAnalysis::isDateHeaderText("Q5 2024"));
}

// 测试行内容模式
TEST(RowAnalysisTest, ContentPattern) {
    core::Grid grid = test::makeGrid({
        {"Region", "Revenue", "Expense", "Margin"},
        {"North", 1, 2, 3},
        {"ab", "cd"}
    });

    auto header = RowAnalysis::contentPattern(grid, 1, 1, 4);
    EXPECT_EQ(header.col_count, 4);
    EXPECT_TRUE(header.has_text_labels);
    EXPECT_FALSE(header.mostly_numeric);
    EXPECT_TRUE(header.isHeaderLike());

    auto data = RowAnalysis::contentPattern(grid, 2, 1, 4);
    EXPECT_TRUE(data.mostly_numeric);
    EXPECT_FALSE(data.has_text_labels);

    // 短文本不算标签
    auto short_text = RowAnalysis::contentPattern(grid, 3, 1, 4);
    EXPECT_FALSE(short_text.has_text_labels);

    auto empty = RowAnalysis::contentPattern(grid, 9, 1, 4);
    EXPECT_EQ(empty.col_count, 0);
}

// 测试行形状签名
TEST(RowAnalysisTest, ColumnPattern) {
    core::Grid grid = test::makeGrid({
        {"Name", core::CellValue(), "$5", 10}
    });
    auto p = RowAnalysis::columnPattern(grid, 1, 1, 4);
    EXPECT_EQ(p.col_count, 3);
    EXPECT_DOUBLE_EQ(p.numeric_ratio, 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(p.text_ratio, 1.0 / 3.0);
    EXPECT_EQ(p.column_span, 4);
    EXPECT_DOUBLE_EQ(p.density, 0.75);
}

// 测试时间行：首列文本作为行标签不参与统计
TEST(RowAnalysisTest, TemporalRowSkipsRowLabel) {
    core::Grid grid = test::makeGrid({
        {"Metric", "2024-01-31", "2024-02-29", "Total"},
        {"Metric", "a", "b", "c", "d"},
        {"2024-01-31"}
    });
    EXPECT_TRUE(RowAnalysis::isTemporalRow(grid, 1, 1, 5));
    EXPECT_FALSE(RowAnalysis::isTemporalRow(grid, 2, 1, 5));
    // 只有一个单元格时不视为行标签
    EXPECT_TRUE(RowAnalysis::isTemporalRow(grid, 3, 1, 5));
    EXPECT_FALSE(RowAnalysis::isTemporalRow(grid, 4, 1, 5));
}

// 测试节标题行
TEST(RowAnalysisTest, SectionHeaderRow) {
    core::Grid grid = test::makeGrid({
        {"Assets"},
        {"Cash", 100},
        {core::CellValue(), "Orphan"},
        {42}
    });
    EXPECT_TRUE(RowAnalysis::isSectionHeaderRow(grid, 1, 1, 2));
    EXPECT_FALSE(RowAnalysis::isSectionHeaderRow(grid, 2, 1, 2));
    EXPECT_FALSE(RowAnalysis::isSectionHeaderRow(grid, 3, 1, 2));
    EXPECT_FALSE(RowAnalysis::isSectionHeaderRow(grid, 4, 1, 2));
}

// 测试数据列范围与下一数据行
TEST(RowAnalysisTest, RangesAndNextRow) {
    core::Grid grid = test::makeGrid({
        {core::CellValue(), "b"},
        {},
        {core::CellValue(), core::CellValue(), "c", "d"}
    });
    EXPECT_EQ(RowAnalysis::dataColumnRange(grid, 1, 3, 1, 4), std::make_pair(2, 4));
    EXPECT_EQ(RowAnalysis::dataColumnRange(grid, 2, 2, 1, 4), std::make_pair(1, 4));
    EXPECT_EQ(RowAnalysis::nextDataRow(grid, 2, 3, 1, 4), 3);
    EXPECT_FALSE(RowAnalysis::nextDataRow(grid, 2, 2, 1, 4).has_value());
    EXPECT_EQ(RowAnalysis::dataRows(grid, grid.bounds()), (std::vector<int>{1, 3}));
}
