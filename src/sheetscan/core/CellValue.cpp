#include "sheetscan/core/CellValue.hpp"
#include "sheetscan/core/Exception.hpp"
#include "sheetscan/utils/CommonUtils.hpp"

#include <fmt/format.h>

namespace sheetscan {
namespace core {

bool CellValue::asBool() const {
    if (!isBool()) {
        throw OperationException(fmt::format("CellValue is {}, not Boolean", toString(type())),
                                 "asBool", ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
    return std::get<bool>(data_);
}

int64_t CellValue::asInteger() const {
    if (isInteger()) {
        return std::get<int64_t>(data_);
    }
    if (isDouble()) {
        return static_cast<int64_t>(std::get<double>(data_));
    }
    throw OperationException(fmt::format("CellValue is {}, not numeric", toString(type())),
                             "asInteger", ErrorCode::InvalidArgument, __FILE__, __LINE__);
}

double CellValue::asNumber() const {
    if (isDouble()) {
        return std::get<double>(data_);
    }
    if (isInteger()) {
        return static_cast<double>(std::get<int64_t>(data_));
    }
    throw OperationException(fmt::format("CellValue is {}, not numeric", toString(type())),
                             "asNumber", ErrorCode::InvalidArgument, __FILE__, __LINE__);
}

const std::string& CellValue::asString() const {
    if (!isString()) {
        throw OperationException(fmt::format("CellValue is {}, not String", toString(type())),
                                 "asString", ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
    return std::get<std::string>(data_);
}

bool CellValue::isMeaningful() const {
    switch (type()) {
        case Type::Null:
            return false;
        case Type::String:
            return !utils::CommonUtils::trim(std::get<std::string>(data_)).empty();
        default:
            return true;
    }
}

std::string CellValue::toDisplayString() const {
    switch (type()) {
        case Type::Null:
            return "";
        case Type::Boolean:
            return std::get<bool>(data_) ? "true" : "false";
        case Type::Integer:
            return fmt::format("{}", std::get<int64_t>(data_));
        case Type::Double:
            return utils::CommonUtils::formatNumber(std::get<double>(data_));
        case Type::String:
            return std::get<std::string>(data_);
    }
    return "";
}

const char* toString(CellValue::Type type) noexcept {
    switch (type) {
        case CellValue::Type::Null:    return "Null";
        case CellValue::Type::Boolean: return "Boolean";
        case CellValue::Type::Integer: return "Integer";
        case CellValue::Type::Double:  return "Double";
        case CellValue::Type::String:  return "String";
    }
    return "Unknown";
}

}} // namespace sheetscan::core
