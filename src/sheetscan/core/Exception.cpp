/**
 * @file Exception.cpp
 * @brief SheetScan异常类实现
 */

#include "sheetscan/core/Exception.hpp"
#include "sheetscan/utils/CommonUtils.hpp"
#include <sstream>
#include <fmt/format.h>

namespace sheetscan {
namespace core {

SheetScanException::SheetScanException(const std::string& message,
                                       ErrorCode code,
                                       const char* file,
                                       int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string SheetScanException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void SheetScanException::addContext(const std::string& context) {
    context_.push_back(context);
}

Error SheetScanException::toError() const {
    std::string ctx;
    for (size_t i = 0; i < context_.size(); ++i) {
        if (i > 0) ctx += "; ";
        ctx += context_[i];
    }
    return Error(error_code_, what(), ctx);
}

ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       ErrorCode code, const char* file, int line)
    : SheetScanException(parameter_name.empty()
                             ? message
                             : fmt::format("{} (parameter: {})", message, parameter_name),
                         code, file, line)
    , parameter_name_(parameter_name) {
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : SheetScanException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : SheetScanException(operation.empty()
                             ? message
                             : fmt::format("{} (operation: {})", message, operation),
                         code, file, line)
    , operation_(operation) {
}

GridException::GridException(const std::string& message, int row, int col,
                             ErrorCode code, const char* file, int line)
    : SheetScanException(row > 0 && col > 0
                             ? fmt::format("{} (cell: {})", message,
                                           utils::CommonUtils::cellReference(row, col))
                             : message,
                         code, file, line)
    , row_(row)
    , col_(col) {
}

std::string GridException::getCellReference() const {
    if (row_ <= 0 || col_ <= 0) {
        return "";
    }
    return utils::CommonUtils::cellReference(row_, col_);
}

}} // namespace sheetscan::core
