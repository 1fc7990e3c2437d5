#include <gtest/gtest.h>
#include <string>
#include "sheetscan/core/Exception.hpp"

using namespace sheetscan::core;

// 测试错误码描述
TEST(ErrorCodeTest, Descriptions) {
    EXPECT_STREQ(toString(ErrorCode::Ok), "Success");
    EXPECT_STREQ(toString(ErrorCode::InvalidConfiguration), "Invalid configuration");
    EXPECT_STREQ(toString(ErrorCode::PoolStopped), "Thread pool stopped");
    EXPECT_STREQ(toName(ErrorCode::InvalidBounds), "InvalidBounds");
    EXPECT_STREQ(toName(ErrorCode::PoolStopped), "PoolStopped");
}

// 测试 Error 结构
TEST(ErrorCodeTest, ErrorStruct) {
    Error ok;
    EXPECT_TRUE(ok.isOk());

    Error plain(ErrorCode::FileNotFound);
    EXPECT_TRUE(plain.isError());
    EXPECT_EQ(plain.message, "File not found");
    EXPECT_EQ(plain.fullMessage(), "File not found");

    Error with_ctx = makeError(ErrorCode::MalformedCell, "bad tuple", "Sheet1");
    EXPECT_EQ(with_ctx.fullMessage(), "bad tuple (Context: Sheet1)");
}

// 测试基础异常的详细信息与上下文
TEST(ExceptionTest, DetailedMessageAndContext) {
    SheetScanException e("something failed", ErrorCode::InvalidRegion, "Foo.cpp", 42);
    EXPECT_STREQ(e.what(), "something failed");
    EXPECT_EQ(e.getErrorCode(), ErrorCode::InvalidRegion);
    EXPECT_EQ(e.getErrorCodeString(), "InvalidRegion");
    EXPECT_EQ(e.getDetailedMessage(), "[InvalidRegion] something failed (at Foo.cpp:42)");

    e.addContext("Sheet1");
    e.addContext("table_2");
    ASSERT_EQ(e.getContext().size(), 2u);
    EXPECT_EQ(e.getDetailedMessage(),
              "[InvalidRegion] something failed (at Foo.cpp:42)\nContext:\n  - Sheet1\n  - table_2");

    Error err = e.toError();
    EXPECT_EQ(err.code, ErrorCode::InvalidRegion);
    EXPECT_EQ(err.message, "something failed");
    EXPECT_EQ(err.context, "Sheet1; table_2");
}

// 测试参数异常
TEST(ExceptionTest, ParameterException) {
    ParameterException e("must be positive", "gap_threshold");
    EXPECT_STREQ(e.what(), "must be positive (parameter: gap_threshold)");
    EXPECT_EQ(e.getParameterName(), "gap_threshold");
    EXPECT_EQ(e.getErrorCode(), ErrorCode::InvalidArgument);

    try {
        SHEETSCAN_THROW_CONFIG("bad value", "table_detection.gap_threshold");
    } catch (const ParameterException& ex) {
        EXPECT_EQ(ex.getErrorCode(), ErrorCode::InvalidConfiguration);
        EXPECT_EQ(ex.getParameterName(), "table_detection.gap_threshold");
        EXPECT_GT(ex.getLine(), 0);
    }
}

// 测试文件、操作、网格异常
TEST(ExceptionTest, DerivedExceptions) {
    FileException fe("cannot open", "data.csv");
    EXPECT_STREQ(fe.what(), "cannot open (file: data.csv)");
    EXPECT_EQ(fe.getFilename(), "data.csv");
    EXPECT_EQ(fe.getErrorCode(), ErrorCode::FileNotFound);

    OperationException oe("stopped", "enqueue", ErrorCode::PoolStopped);
    EXPECT_STREQ(oe.what(), "stopped (operation: enqueue)");
    EXPECT_EQ(oe.getOperation(), "enqueue");

    GridException ge("bad cell", 3, 2);
    EXPECT_STREQ(ge.what(), "bad cell (cell: B3)");
    EXPECT_EQ(ge.getCellReference(), "B3");
    EXPECT_EQ(ge.getRow(), 3);
    EXPECT_EQ(ge.getCol(), 2);
    EXPECT_EQ(ge.getErrorCode(), ErrorCode::InvalidCellReference);

    GridException no_cell("bad reference");
    EXPECT_STREQ(no_cell.what(), "bad reference");
    EXPECT_EQ(no_cell.getCellReference(), "");
}

// 测试异常层次
TEST(ExceptionTest, Hierarchy) {
    EXPECT_THROW(throw FileException("x", "y"), SheetScanException);
    EXPECT_THROW(throw GridException("x"), std::runtime_error);
    EXPECT_THROW(SHEETSCAN_THROW_IF(true, OperationException, "x", "op"), SheetScanException);
    EXPECT_NO_THROW(SHEETSCAN_THROW_IF(false, OperationException, "x", "op"));
}
