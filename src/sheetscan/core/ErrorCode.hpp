#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace sheetscan {
namespace core {

/**
 * @brief SheetScan统一错误码
 *
 * 只包含表格结构推断相关的错误：
 * - 启发式"未匹配"不是错误，不会出现在这里
 * - 只有调用方输入不一致或编程错误才会产生错误码
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 2,
    NullGrid = 3,

    // 网格/区域错误 (20-39)
    InvalidBounds = 20,
    InvalidRegion = 21,
    InvalidCellReference = 22,
    MalformedCell = 23,

    // 配置错误 (40-49)
    InvalidConfiguration = 40,

    // 文件操作错误 (60-69)
    FileNotFound = 60,
    FileReadError = 61,

    // 并发 (80-89)
    PoolStopped = 80
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息（工作表名等）

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转可读字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码转枚举名（用于异常详细信息）
 */
const char* toName(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

}} // namespace sheetscan::core
