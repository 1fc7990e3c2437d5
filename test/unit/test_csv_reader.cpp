#include <gtest/gtest.h>
#include "sheetscan/input/CsvGridReader.hpp"
#include "sheetscan/core/Exception.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace sheetscan::core;
using namespace sheetscan::input;

class CsvGridReaderTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& path : created_) {
            std::remove(path.c_str());
        }
    }

    std::string writeTempFile(const std::string& name, const std::string& content) {
        std::string path = (std::filesystem::temp_directory_path() / name).string();
        std::ofstream out(path, std::ios::binary);
        out << content;
        created_.push_back(path);
        return path;
    }

    std::vector<std::string> created_;
};

// 测试引号、转义与多行字段
TEST_F(CsvGridReaderTest, ParseQuotedFields) {
    CsvGridReader reader;
    auto rows = reader.parseString("a,\"b,c\",\"say \"\"hi\"\"\"\n\"multi\nline\",x\r\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (std::vector<std::string>{"a", "b,c", "say \"hi\""}));
    EXPECT_EQ(rows[1], (std::vector<std::string>{"multi\nline", "x"}));
}

// 测试类型推断
TEST_F(CsvGridReaderTest, InferValues) {
    CsvGridReader reader;
    EXPECT_EQ(reader.inferValue("42"), CellValue(int64_t{42}));
    EXPECT_EQ(reader.inferValue("-3.5"), CellValue(-3.5));
    EXPECT_EQ(reader.inferValue("TRUE"), CellValue(true));
    EXPECT_EQ(reader.inferValue("false"), CellValue(false));
    EXPECT_EQ(reader.inferValue("Widget"), CellValue("Widget"));
    EXPECT_TRUE(reader.inferValue("").isNull());

    CsvOptions raw;
    raw.infer_types = false;
    CsvGridReader text_reader(raw);
    EXPECT_EQ(text_reader.inferValue("42"), CellValue("42"));
}

// 测试空行保留行号
TEST_F(CsvGridReaderTest, BlankLinesKeepRowNumbers) {
    CsvGridReader reader;
    Grid grid = reader.readString("Name,Qty\nPen,3\n\n\nInk,2\n", "Stock");

    EXPECT_EQ(grid.name(), "Stock");
    EXPECT_EQ(grid.bounds(), SheetBounds(1, 5, 1, 2));
    ASSERT_TRUE(grid.has(5, 1));
    EXPECT_EQ(grid.find(5, 1)->value.asString(), "Ink");
    EXPECT_EQ(grid.find(2, 2)->value.asInteger(), 3);
    EXPECT_TRUE(grid.row(3).empty());
}

// 测试自定义分隔符
TEST_F(CsvGridReaderTest, CustomDelimiter) {
    CsvOptions options;
    options.delimiter = ';';
    CsvGridReader reader(options);
    Grid grid = reader.readString("a;b\n1;2.5\n");
    EXPECT_EQ(grid.cellCount(), 4u);
    EXPECT_EQ(grid.find(2, 2)->value, CellValue(2.5));
}

// 测试读取文件：工作表名取文件名，去掉 BOM
TEST_F(CsvGridReaderTest, ReadFile) {
    std::string path = writeTempFile("sheetscan_budget.csv", "\xEF\xBB\xBFItem,Cost\nRent,1200\n");
    CsvGridReader reader;
    Grid grid = reader.readFile(path);
    EXPECT_EQ(grid.name(), "sheetscan_budget");
    EXPECT_EQ(grid.find(1, 1)->value.asString(), "Item");
    EXPECT_EQ(grid.find(2, 2)->value.asInteger(), 1200);
}

// 测试文件不存在
TEST_F(CsvGridReaderTest, MissingFileThrows) {
    CsvGridReader reader;
    try {
        reader.readFile("/nonexistent/sheetscan/missing.csv");
        FAIL() << "expected FileException";
    } catch (const FileException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::FileNotFound);
        EXPECT_EQ(e.getFilename(), "/nonexistent/sheetscan/missing.csv");
    }
}
