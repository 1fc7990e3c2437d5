#include <gtest/gtest.h>
#include "sheetscan/input/GridNormalizer.hpp"
#include "sheetscan/core/Exception.hpp"

using namespace sheetscan::core;
using namespace sheetscan::input;

class GridNormalizerTest : public ::testing::Test {
protected:
    std::vector<CompactRow> compactRows() const {
        CompactRow header;
        header.r = 1;
        header.cells = {{1, "Name"}, {2, "Qty"}};

        CompactRow data;
        data.r = 2;
        data.cells = {
            {1, "a"},
            {2, 0, 3},          // 游程：B2:D2 都是 0
            {5},                // 元素不足，跳过
            {"x", "bad col"},   // 列号不是整数，跳过
            {0, "zero col"}     // 列号 < 1，跳过
        };
        return {header, data};
    }
};

// 测试坐标键格式：row/column 缺省时从键解析
TEST_F(GridNormalizerTest, DenseFromKeys) {
    DenseCellMap cells;
    cells["A1"] = DenseCellRecord(CellValue("Name"));
    cells["C2"] = DenseCellRecord(CellValue(5));
    cells["??"] = DenseCellRecord(CellValue("skipped"));
    cells["ignored"] = DenseCellRecord(CellValue("explicit"), 3, 2);

    SheetMeta meta;
    meta.name = "Dense";
    Grid grid = GridNormalizer::fromDense(cells, meta);

    EXPECT_EQ(grid.name(), "Dense");
    EXPECT_EQ(grid.cellCount(), 3u);
    EXPECT_EQ(grid.find(1, 1)->value.asString(), "Name");
    EXPECT_EQ(grid.find(2, 3)->value.asInteger(), 5);
    EXPECT_EQ(grid.find(3, 2)->value.asString(), "explicit");
    EXPECT_EQ(grid.bounds(), SheetBounds(1, 3, 1, 3));
}

// 测试紧凑格式：游程与坏元组
TEST_F(GridNormalizerTest, CompactWithRunsAndMalformedTuples) {
    Grid grid = GridNormalizer::fromCompact(compactRows());

    EXPECT_EQ(grid.cellCount(), 4u);
    const GridCell* run = grid.find(2, 2);
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run->run_length, 3);
    EXPECT_EQ(run->value.asInteger(), 0);
    EXPECT_FALSE(grid.has(2, 3));
    EXPECT_FALSE(grid.has(2, 5));

    // 推导边界包含游程末列
    EXPECT_EQ(grid.bounds(), SheetBounds(1, 2, 1, 4));
}

// 测试单个元组解析规则
TEST_F(GridNormalizerTest, ParseCompactTuple) {
    EXPECT_FALSE(GridNormalizer::parseCompactTuple(1, {}).has_value());
    EXPECT_FALSE(GridNormalizer::parseCompactTuple(1, {3}).has_value());
    EXPECT_FALSE(GridNormalizer::parseCompactTuple(1, {1.5, "v"}).has_value());

    // 两元素元组的整数值不是游程
    auto plain = GridNormalizer::parseCompactTuple(1, {2, 9});
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->run_length, 1);
    EXPECT_EQ(plain->value.asInteger(), 9);

    // 末元素 1 或非整数不是游程
    EXPECT_EQ(GridNormalizer::parseCompactTuple(1, {2, "v", 1})->run_length, 1);
    EXPECT_EQ(GridNormalizer::parseCompactTuple(1, {2, "v", 4.0})->run_length, 1);

    // 整值 double 列号可接受
    auto from_double = GridNormalizer::parseCompactTuple(4, {3.0, "v", "style", 5});
    ASSERT_TRUE(from_double.has_value());
    EXPECT_EQ(from_double->row, 4);
    EXPECT_EQ(from_double->col, 3);
    EXPECT_EQ(from_double->run_length, 5);
}

// 测试两种输入表示得到相同网格
TEST_F(GridNormalizerTest, RepresentationsAgree) {
    DenseCellMap dense;
    dense["A1"] = DenseCellRecord(CellValue("Name"));
    dense["B1"] = DenseCellRecord(CellValue("Qty"));
    dense["A2"] = DenseCellRecord(CellValue("a"));
    dense["B2"] = DenseCellRecord(CellValue(7));

    CompactRow r1;
    r1.r = 1;
    r1.cells = {{1, "Name"}, {2, "Qty"}};
    CompactRow r2;
    r2.r = 2;
    r2.cells = {{1, "a"}, {2, 7}};

    Grid a = GridNormalizer::fromDense(dense);
    Grid b = GridNormalizer::fromCompact({r1, r2});

    EXPECT_EQ(a.bounds(), b.bounds());
    ASSERT_EQ(a.cellCount(), b.cellCount());
    for (const auto& [row, cells] : a.rows()) {
        for (const auto& [col, cell] : cells) {
            const GridCell* other = b.find(row, col);
            ASSERT_NE(other, nullptr);
            EXPECT_EQ(cell.value, other->value);
        }
    }
}

// 测试给定边界与冻结窗格
TEST_F(GridNormalizerTest, SuppliedMeta) {
    SheetMeta meta;
    meta.bounds = SheetBounds(1, 20, 1, 10);
    meta.frozen = FrozenPanes(2, 1);
    Grid grid = GridNormalizer::fromRows({{"a", "b"}}, meta);
    EXPECT_EQ(grid.bounds(), SheetBounds(1, 20, 1, 10));
    EXPECT_EQ(grid.frozen(), FrozenPanes(2, 1));
}

// 测试给定的非法边界
TEST_F(GridNormalizerTest, SuppliedInvalidBoundsThrow) {
    SheetMeta meta;
    meta.bounds = SheetBounds(10, 1, 1, 5);
    EXPECT_THROW(GridNormalizer::fromRows({{"a"}}, meta), ParameterException);
}

// 测试没有任何单元格的网格
TEST_F(GridNormalizerTest, EmptyInput) {
    Grid grid = GridNormalizer::fromRows({});
    EXPECT_TRUE(grid.empty());
    EXPECT_TRUE(grid.bounds().isValid());
}
