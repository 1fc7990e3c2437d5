/**
 * @file Exception.hpp
 * @brief SheetScan异常类定义
 */

#ifndef SHEETSCAN_EXCEPTION_HPP
#define SHEETSCAN_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace sheetscan {
namespace core {

/**
 * @brief SheetScan基础异常类
 *
 * 只用于硬错误：调用方给出的边界不一致、配置值非法、文件不可读等。
 * 检测策略"没有结果"属于正常控制流，不抛异常。
 */
class SheetScanException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    SheetScanException(const std::string& message,
                       ErrorCode code = ErrorCode::InternalError,
                       const char* file = nullptr,
                       int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const { return toName(error_code_); }

    /**
     * @brief 获取详细错误信息（含错误码、位置和上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    /**
     * @brief 添加上下文信息（例如工作表名）
     */
    void addContext(const std::string& context);

    const std::vector<std::string>& getContext() const { return context_; }

    /**
     * @brief 转换为错误对象
     */
    Error toError() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public SheetScanException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public SheetScanException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 操作相关异常
 */
class OperationException : public SheetScanException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InternalError,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief 网格相关异常（空网格、坐标非法）
 */
class GridException : public SheetScanException {
public:
    GridException(const std::string& message,
                  int row = -1, int col = -1,
                  ErrorCode code = ErrorCode::InvalidCellReference,
                  const char* file = nullptr, int line = 0);

    int getRow() const { return row_; }
    int getCol() const { return col_; }
    std::string getCellReference() const;

private:
    int row_;
    int col_;
};

} // namespace core
} // namespace sheetscan

// 便捷宏定义
#define SHEETSCAN_THROW_PARAM(message, parameter) \
    throw ::sheetscan::core::ParameterException((message), (parameter), \
        ::sheetscan::core::ErrorCode::InvalidArgument, __FILE__, __LINE__)

#define SHEETSCAN_THROW_BOUNDS(message) \
    throw ::sheetscan::core::ParameterException((message), "bounds", \
        ::sheetscan::core::ErrorCode::InvalidBounds, __FILE__, __LINE__)

#define SHEETSCAN_THROW_CONFIG(message, key) \
    throw ::sheetscan::core::ParameterException((message), (key), \
        ::sheetscan::core::ErrorCode::InvalidConfiguration, __FILE__, __LINE__)

#define SHEETSCAN_THROW_OP(message) \
    throw ::sheetscan::core::OperationException((message), __func__, \
        ::sheetscan::core::ErrorCode::InternalError, __FILE__, __LINE__)

#define SHEETSCAN_THROW_IF(condition, ExceptionType, ...) \
    do { if (condition) { throw ExceptionType(__VA_ARGS__); } } while(0)

#endif // SHEETSCAN_EXCEPTION_HPP
