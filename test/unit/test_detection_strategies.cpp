#include <gtest/gtest.h>
#include "sheetscan/detection/RegionValidator.hpp"
#include "sheetscan/detection/strategies/BlankRowSeparationStrategy.hpp"
#include "sheetscan/detection/strategies/ColumnContinuityStrategy.hpp"
#include "sheetscan/detection/strategies/ContentStructureStrategy.hpp"
#include "sheetscan/detection/strategies/DefaultStrategy.hpp"
#include "sheetscan/detection/strategies/FinancialStatementStrategy.hpp"
#include "sheetscan/detection/strategies/FormattingStrategy.hpp"
#include "sheetscan/detection/strategies/FrozenPaneStrategy.hpp"
#include "sheetscan/detection/strategies/GapStrategy.hpp"
#include "sheetscan/detection/strategies/MultiRowHeaderStrategy.hpp"
#include "sheetscan/detection/strategies/TemporalHeaderStrategy.hpp"
#include "GridFixtures.hpp"

using namespace sheetscan;
using namespace sheetscan::detection;
using core::CellValue;

class DetectionStrategyTest : public ::testing::Test {
protected:
    RegionList run(const IDetectionStrategy& strategy, const core::Grid& grid,
                   const DetectionOptions& options = DetectionOptions()) const {
        return strategy.detect(grid, grid.bounds(), options);
    }

    static test::ValueRows financialRows() {
        return {
            {"Current Assets"},
            {"Cash", 100, 200, 300},
            {"Receivables", 50, 60, 70},
            {"Liabilities"},
            {"Payables", 10, 20, 30},
            {"Debt", 5, 6, 7}
        };
    }

    static test::ValueRows sectionedRows() {
        return {
            {"Region", "Q1", "Q2"},
            {"North", 1, 2},
            {},
            {"West"},
            {"South", 3, 4},
            {"East", 5, 6}
        };
    }

    static test::ValueRows multiHeaderRows() {
        return {
            {"Region", "Revenue", "Expense", "Margin"},
            {"Area", "Actual", "Budget", "Forecast"},
            {"North", 1, 2, 3},
            {"South", 4, 5, 6}
        };
    }

    static test::ValueRows smallGapRows() {
        return {
            {"A", 1},
            {"B", 2},
            {}, {}, {},
            {"C", 3}
        };
    }
};

// 测试冻结窗格：整张表一个区域并携带冻结信息
TEST_F(DetectionStrategyTest, FrozenPanes) {
    FrozenPaneStrategy strategy;
    EXPECT_STREQ(strategy.name(), "frozen_panes");

    core::Grid frozen = test::makeFrozenGrid(test::yearMonthRows(), 2, 0);
    RegionList regions = run(strategy, frozen);
    ASSERT_EQ(regions.size(), 1u);
    Region expected(1, 4, 1, 3, methods::kFrozenPanes);
    expected.frozen = core::FrozenPanes(2, 0);
    EXPECT_EQ(regions[0], expected);

    EXPECT_TRUE(run(strategy, test::makeGrid(test::yearMonthRows())).empty());

    // 配置中的冻结窗格覆盖网格
    DetectionOptions options;
    options.frozen = core::FrozenPanes(1, 1);
    regions = run(strategy, test::makeGrid(test::yearMonthRows()), options);
    ASSERT_EQ(regions.size(), 1u);
    EXPECT_EQ(regions[0].frozen, core::FrozenPanes(1, 1));

    options.frozen = core::FrozenPanes(0, 0);
    EXPECT_TRUE(run(strategy, frozen, options).empty());
}

// 测试财务报表布局
TEST_F(DetectionStrategyTest, FinancialStatement) {
    FinancialStatementStrategy strategy;
    RegionList regions = run(strategy, test::makeGrid(financialRows()));
    ASSERT_EQ(regions.size(), 1u);
    EXPECT_EQ(regions[0], Region(1, 6, 1, 4, methods::kFinancialStatement));

    // 节标题不含财务术语
    test::ValueRows produce = financialRows();
    produce[0] = {"Fruits"};
    produce[3] = {"Vegetables"};
    EXPECT_TRUE(run(strategy, test::makeGrid(produce)).empty());

    EXPECT_TRUE(FinancialStatementStrategy::containsFinancialTerm("Total Equity"));
    EXPECT_FALSE(FinancialStatementStrategy::containsFinancialTerm("Headcount"));
}

// 测试空行分隔：>= 4 个空行必为边界
TEST_F(DetectionStrategyTest, BlankRowHardGap) {
    BlankRowSeparationStrategy strategy;
    RegionList regions = run(strategy, test::makeGrid(test::twoBlocksRows()));
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0], Region(1, 3, 1, 3, methods::kBlankRowSeparation));
    EXPECT_EQ(regions[1], Region(8, 10, 1, 3, methods::kBlankRowSeparation));
}

// 测试空行分隔：日期表头强制开始新表
TEST_F(DetectionStrategyTest, BlankRowDateHeaderForcesBoundary) {
    BlankRowSeparationStrategy strategy;
    core::Grid grid = test::makeGrid({
        {"Metric", "2024-01-31", "2024-02-29"},
        {"Sales", 1, 2},
        {"Cost", 3, 4},
        {},
        {"Metric", "2024-03-31", "2024-04-30"},
        {"Sales", 5, 6}
    });
    RegionList regions = run(strategy, grid);
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0], Region(1, 3, 1, 3, methods::kBlankRowSeparation));
    EXPECT_EQ(regions[1], Region(5, 6, 1, 3, methods::kBlankRowSeparation));
}

// 测试空行分隔：表内节标题不拆分
TEST_F(DetectionStrategyTest, BlankRowSectionHeaderKeepsTable) {
    core::Grid grid = test::makeGrid(sectionedRows());
    const std::vector<int> rows = {1, 2, 4, 5, 6};
    EXPECT_TRUE(BlankRowSeparationStrategy::isSectionHeaderWithinTable(grid, rows, 2, 1, 3));
    EXPECT_FALSE(BlankRowSeparationStrategy::isSectionHeaderWithinTable(grid, rows, 0, 1, 3));
    EXPECT_FALSE(BlankRowSeparationStrategy::isSectionHeaderWithinTable(grid, rows, 3, 1, 3));

    BlankRowSeparationStrategy strategy;
    EXPECT_TRUE(run(strategy, grid).empty());
}

// 测试空行分隔：数据行不足
TEST_F(DetectionStrategyTest, BlankRowNeedsFourRows) {
    BlankRowSeparationStrategy strategy;
    EXPECT_TRUE(run(strategy, test::makeGrid(smallGapRows())).empty());
}

// 测试时间表头
TEST_F(DetectionStrategyTest, TemporalHeaders) {
    core::Grid grid = test::makeGrid({
        {"Metric", "2024-01-31", "2024-02-29"},
        {"Sales", 1, 2},
        {"Cost", 3, 4},
        {},
        {},
        {"Other", 5, 6}
    });
    TemporalHeaderStrategy strategy;
    RegionList regions = run(strategy, grid);
    ASSERT_EQ(regions.size(), 1u);
    EXPECT_EQ(regions[0], Region(1, 3, 1, 3, methods::kTemporalHeaders));
    EXPECT_EQ(TemporalHeaderStrategy::findTableEnd(grid, 1, grid.bounds()), 3);

    EXPECT_TRUE(run(strategy, test::makeGrid(test::productRows())).empty());
}

// 测试列连续性：短表头段并入其后的数据段
TEST_F(DetectionStrategyTest, ColumnContinuity) {
    ColumnContinuityStrategy strategy;
    RegionList regions = run(strategy, test::makeGrid(sectionedRows()));
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0], Region(1, 2, 1, 3, methods::kColumnContinuity));
    EXPECT_EQ(regions[1], Region(4, 6, 1, 3, methods::kColumnContinuity));

    // 表头 + 数据的单一块不拆分
    EXPECT_TRUE(run(strategy, test::makeGrid(multiHeaderRows())).empty());
}

// 测试列连续性：紧贴数值块的短文本段被当作其表头带，不单独成表
TEST_F(DetectionStrategyTest, ColumnContinuityAbsorbsShortTextBlock) {
    ColumnContinuityStrategy strategy;
    core::Grid grid = test::makeGrid({
        {"Apples", "Pears", "Plums"},
        {"Grapes", "Figs", "Limes"},
        {1, 2, 3},
        {4, 5, 6},
        {"North", "South", "East"},
        {"West", "Central", "Coast"},
        {7, 8, 9},
        {10, 11, 12}
    });
    RegionList regions = run(strategy, grid);
    ASSERT_EQ(regions.size(), 2u);
    Region first(1, 4, 1, 3, methods::kColumnContinuity);
    Region second(5, 8, 1, 3, methods::kColumnContinuity);
    EXPECT_EQ(regions[0], first);
    EXPECT_EQ(regions[1], second);
}

// 测试显著变化判断
TEST_F(DetectionStrategyTest, SignificantChange) {
    ColumnPattern a;
    a.col_count = 3;
    a.numeric_ratio = 0.5;
    a.column_span = 3;
    a.density = 1.0;

    ColumnPattern b = a;
    EXPECT_FALSE(ColumnContinuityStrategy::isSignificantChange(a, b));
    b.numeric_ratio = 0.95;
    EXPECT_TRUE(ColumnContinuityStrategy::isSignificantChange(a, b));
    b = a;
    b.col_count = 9;
    EXPECT_TRUE(ColumnContinuityStrategy::isSignificantChange(a, b));
    b = a;
    b.density = 0.6;
    EXPECT_TRUE(ColumnContinuityStrategy::isSignificantChange(a, b));
}

// 测试多行表头
TEST_F(DetectionStrategyTest, MultiRowHeaders) {
    MultiRowHeaderStrategy strategy;
    RegionList regions = run(strategy, test::makeGrid(multiHeaderRows()));
    ASSERT_EQ(regions.size(), 1u);
    EXPECT_EQ(regions[0], Region(1, 4, 1, 4, methods::kMultirowHeaders));

    EXPECT_TRUE(run(strategy, test::makeGrid(test::productRows())).empty());
}

// 测试空行间隔分割只在 use_gaps 时运行
TEST_F(DetectionStrategyTest, Gaps) {
    GapStrategy strategy;
    core::Grid grid = test::makeGrid(smallGapRows());

    EXPECT_TRUE(run(strategy, grid).empty());

    DetectionOptions options;
    options.use_gaps = true;
    RegionList regions = run(strategy, grid, options);
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0], Region(1, 2, 1, 2, methods::kGaps));
    EXPECT_EQ(regions[1], Region(6, 6, 1, 2, methods::kGaps));

    options.gap_threshold = 4;
    regions = run(strategy, grid, options);
    ASSERT_EQ(regions.size(), 1u);
    EXPECT_EQ(regions[0], Region(1, 6, 1, 2, methods::kGaps));
}

// 测试兜底策略
TEST_F(DetectionStrategyTest, Fallbacks) {
    FormattingStrategy formatting;
    EXPECT_TRUE(run(formatting, test::makeGrid(smallGapRows())).empty());

    ContentStructureStrategy structure;
    EXPECT_TRUE(run(structure, test::makeGrid(test::productRows())).empty());
    RegionList regions = run(structure, test::makeGrid(smallGapRows()));
    ASSERT_EQ(regions.size(), 1u);
    EXPECT_EQ(regions[0], Region(1, 6, 1, 2, methods::kContentStructure));

    DefaultStrategy fallback;
    EXPECT_TRUE(run(fallback, test::makeGrid({})).empty());
    regions = run(fallback, test::makeGrid(test::productRows()));
    ASSERT_EQ(regions.size(), 1u);
    EXPECT_EQ(regions[0], Region(1, 2, 1, 3, methods::kDefault));
}

// 测试区域校验：裁剪、丢弃空区域、补全方法名
TEST_F(DetectionStrategyTest, RegionValidator) {
    RegionValidator validator;
    core::SheetBounds bounds(1, 10, 1, 5);

    RegionList input = {
        Region(0, 12, 2, 9, "gaps"),
        Region(11, 15, 1, 5, "gaps"),
        Region(3, 2, 1, 5, "gaps"),
        Region(2, 3, 1, 1, "")
    };
    RegionList out = validator.validate(input, bounds);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], Region(1, 10, 2, 5, "gaps"));
    EXPECT_EQ(out[1], Region(2, 3, 1, 1, "unknown"));
}
