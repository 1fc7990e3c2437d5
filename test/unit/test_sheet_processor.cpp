#include <gtest/gtest.h>
#include "sheetscan/SheetScan.hpp"
#include "GridFixtures.hpp"

using namespace sheetscan;
using detection::DetectionOptions;
using table::SheetProcessor;
using table::Table;
using table::TableMode;

class SheetProcessorTest : public ::testing::Test {
protected:
    SheetProcessor processor_;
    DetectionOptions options_;
};

// 测试单表工作表
TEST_F(SheetProcessorTest, SingleTable) {
    std::vector<Table> tables = processor_.process(test::makeGrid(test::productRows()), options_);
    ASSERT_EQ(tables.size(), 1u);
    EXPECT_EQ(tables[0].id(), "table_1");
    EXPECT_EQ(tables[0].metadata().detection_method, "default");
    EXPECT_EQ(tables[0].columnLabels(), (std::vector<std::string>{"Product", "Jan", "Feb"}));
    EXPECT_EQ(tables[0].rows()[1].label, "Widget A");
}

// 测试冻结表头的工作表
TEST_F(SheetProcessorTest, FrozenHeaders) {
    std::vector<Table> tables = processor_.process(test::makeFrozenGrid(test::yearMonthRows(), 2, 0), options_);
    ASSERT_EQ(tables.size(), 1u);
    const Table& t = tables[0];
    EXPECT_EQ(t.metadata().detection_method, "frozen_panes");
    EXPECT_EQ(t.headerInfo().header_rows, (std::vector<int>{1, 2}));
    EXPECT_EQ(t.columnLabels(), (std::vector<std::string>{"Jan 2023", "Feb 2023", "Mar 2023"}));
    for (const auto& row : t.rows()) {
        EXPECT_EQ(row.label, "Jan 2023");
    }
}

// 测试多张表按顺序编号
TEST_F(SheetProcessorTest, TableIdsInOrder) {
    std::vector<Table> tables = processor_.process(test::makeGrid(test::twoBlocksRows()), options_);
    ASSERT_EQ(tables.size(), 2u);
    EXPECT_EQ(tables[0].id(), "table_1");
    EXPECT_EQ(tables[1].id(), "table_2");
    EXPECT_EQ(tables[0].region().start_row, 1);
    EXPECT_EQ(tables[1].region().start_row, 8);
    EXPECT_EQ(tables[1].columnLabels(), (std::vector<std::string>{"Item", "Qty", "Price"}));
}

// 测试紧凑模式使用更小的空行阈值
TEST_F(SheetProcessorTest, CompactUsesCompactGapThreshold) {
    core::Grid grid = test::makeGrid({
        {"A", 1},
        {"B", 2},
        {}, {},
        {"C", 3}
    });
    options_.use_gaps = true;

    std::vector<Table> verbose = processor_.process(grid, options_, TableMode::Verbose);
    ASSERT_EQ(verbose.size(), 1u);
    EXPECT_EQ(verbose[0].metadata().detection_method, "gaps");

    std::vector<Table> compact = processor_.process(grid, options_, TableMode::Compact);
    ASSERT_EQ(compact.size(), 2u);
    EXPECT_EQ(compact[0].mode(), TableMode::Compact);
    EXPECT_EQ(compact[1].region().start_row, 5);
}

// 测试空工作表
TEST_F(SheetProcessorTest, EmptySheet) {
    EXPECT_TRUE(processor_.process(test::makeGrid({}), options_).empty());
    EXPECT_TRUE(processor_.process(test::makeGrid({}), options_, TableMode::Compact).empty());
}

// 测试非法配置抛出异常
TEST_F(SheetProcessorTest, InvalidOptionsThrow) {
    options_.gap_threshold = 0;
    try {
        processor_.process(test::makeGrid(test::productRows()), options_);
        FAIL() << "expected ParameterException";
    } catch (const core::ParameterException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::InvalidConfiguration);
    }
}

// 测试无表头内容的列标签
TEST_F(SheetProcessorTest, UnlabeledColumn) {
    std::vector<Table> tables = processor_.process(test::makeGrid({
        {"Name", core::CellValue(), "Score"},
        {"x", 1, 2}
    }), options_);
    ASSERT_EQ(tables.size(), 1u);
    EXPECT_EQ(tables[0].columnLabels(), (std::vector<std::string>{"Name", "unlabeled", "Score"}));
}

// 测试顶层入口
TEST_F(SheetProcessorTest, ProcessSheetEntry) {
    std::vector<Table> tables = sheetscan::processSheet(test::makeGrid(test::productRows()));
    ASSERT_EQ(tables.size(), 1u);
    EXPECT_EQ(tables[0].mode(), TableMode::Verbose);
    EXPECT_EQ(sheetscan::getVersion(), SHEETSCAN_VERSION_STRING);
}
