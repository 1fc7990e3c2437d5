#include <gtest/gtest.h>
#include "sheetscan/headers/HeaderResolver.hpp"

using namespace sheetscan;
using detection::Region;
using headers::HeaderInfo;
using headers::HeaderResolver;

class HeaderResolverTest : public ::testing::Test {
protected:
    HeaderResolver resolver_;
};

// 测试无冻结提示：首行首列为表头
TEST_F(HeaderResolverTest, DefaultsToFirstRowAndColumn) {
    HeaderInfo info = resolver_.resolve(Region(1, 4, 1, 3, "default"), core::FrozenPanes());
    EXPECT_EQ(info.header_rows, (std::vector<int>{1}));
    EXPECT_EQ(info.header_columns, (std::vector<int>{1}));
    EXPECT_EQ(info.data_start_row, 2);
    EXPECT_EQ(info.data_start_col, 2);
    EXPECT_TRUE(info.isHeaderRow(1));
    EXPECT_FALSE(info.isHeaderRow(2));
    EXPECT_TRUE(info.isHeaderColumn(1));
}

// 测试区域不从第一行开始
TEST_F(HeaderResolverTest, OffsetRegion) {
    HeaderInfo info = resolver_.resolve(Region(8, 10, 2, 4, "gaps"), core::FrozenPanes());
    EXPECT_EQ(info.header_rows, (std::vector<int>{8}));
    EXPECT_EQ(info.header_columns, (std::vector<int>{2}));
    EXPECT_EQ(info.data_start_row, 9);
    EXPECT_EQ(info.data_start_col, 3);
}

// 测试冻结行列
TEST_F(HeaderResolverTest, FrozenHeaders) {
    HeaderInfo info = resolver_.resolve(Region(1, 6, 1, 4, "frozen_panes"), core::FrozenPanes(2, 0));
    EXPECT_EQ(info.header_rows, (std::vector<int>{1, 2}));
    EXPECT_EQ(info.header_columns, (std::vector<int>{1}));
    EXPECT_EQ(info.data_start_row, 3);
    EXPECT_EQ(info.data_start_col, 2);

    info = resolver_.resolve(Region(1, 6, 1, 4, "frozen_panes"), core::FrozenPanes(1, 2));
    EXPECT_EQ(info.header_rows, (std::vector<int>{1}));
    EXPECT_EQ(info.header_columns, (std::vector<int>{1, 2}));
    EXPECT_EQ(info.data_start_col, 3);
}

// 测试冻结行数超过区域时裁剪
TEST_F(HeaderResolverTest, FrozenClippedToRegion) {
    HeaderInfo info = resolver_.resolve(Region(1, 3, 1, 2, "frozen_panes"), core::FrozenPanes(10, 5));
    EXPECT_EQ(info.header_rows, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(info.header_columns, (std::vector<int>{1, 2}));
    EXPECT_EQ(info.data_start_row, 4);
    EXPECT_EQ(info.data_start_col, 3);
}

// 测试单行/单列区域没有默认表头
TEST_F(HeaderResolverTest, SingleRowOrColumn) {
    HeaderInfo row_only = resolver_.resolve(Region(5, 5, 2, 4, "gaps"), core::FrozenPanes());
    EXPECT_TRUE(row_only.header_rows.empty());
    EXPECT_EQ(row_only.header_columns, (std::vector<int>{2}));
    EXPECT_EQ(row_only.data_start_row, 5);
    EXPECT_EQ(row_only.data_start_col, 3);

    HeaderInfo cell = resolver_.resolve(Region(2, 2, 2, 2, "gaps"), core::FrozenPanes());
    EXPECT_TRUE(cell.header_rows.empty());
    EXPECT_TRUE(cell.header_columns.empty());
    EXPECT_EQ(cell.data_start_row, 2);
    EXPECT_EQ(cell.data_start_col, 2);
}

// 测试表头索引始终位于区域内
TEST_F(HeaderResolverTest, HeadersInsideRegion) {
    const Region region(3, 7, 2, 6, "frozen_panes");
    for (int fr = 0; fr < 8; ++fr) {
        for (int fc = 0; fc < 8; ++fc) {
            HeaderInfo info = resolver_.resolve(region, core::FrozenPanes(fr, fc));
            for (int r : info.header_rows) {
                EXPECT_TRUE(r >= region.start_row && r <= region.end_row);
            }
            for (int c : info.header_columns) {
                EXPECT_TRUE(c >= region.start_col && c <= region.end_col);
            }
            EXPECT_EQ(info.data_start_row, region.start_row + static_cast<int>(info.header_rows.size()));
            EXPECT_EQ(info.data_start_col, region.start_col + static_cast<int>(info.header_columns.size()));
        }
    }
}
