#include "sheetscan/core/ErrorCode.hpp"

namespace sheetscan {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";
        case ErrorCode::NullGrid:
            return "Grid is null";

        // 网格/区域错误
        case ErrorCode::InvalidBounds:
            return "Invalid sheet bounds";
        case ErrorCode::InvalidRegion:
            return "Invalid table region";
        case ErrorCode::InvalidCellReference:
            return "Invalid cell reference";
        case ErrorCode::MalformedCell:
            return "Malformed cell record";

        // 配置错误
        case ErrorCode::InvalidConfiguration:
            return "Invalid configuration";

        // 文件操作错误
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileReadError:
            return "File read error";

        case ErrorCode::PoolStopped:
            return "Thread pool stopped";

        default:
            return "Unknown error";
    }
}

const char* toName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::NullGrid: return "NullGrid";
        case ErrorCode::InvalidBounds: return "InvalidBounds";
        case ErrorCode::InvalidRegion: return "InvalidRegion";
        case ErrorCode::InvalidCellReference: return "InvalidCellReference";
        case ErrorCode::MalformedCell: return "MalformedCell";
        case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::PoolStopped: return "PoolStopped";
        default: return "Unknown";
    }
}

}} // namespace sheetscan::core
