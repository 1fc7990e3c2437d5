#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace sheetscan {
namespace core {

/**
 * @brief 单元格标量值：null | bool | integer | double | string
 *
 * 只保存提取器给出的原始值，不做公式求值。
 */
class CellValue {
public:
    enum class Type : uint8_t {
        Null = 0,
        Boolean,
        Integer,
        Double,
        String
    };

    CellValue() = default;
    CellValue(bool v) : data_(v) {}
    CellValue(int v) : data_(static_cast<int64_t>(v)) {}
    CellValue(int64_t v) : data_(v) {}
    CellValue(double v) : data_(v) {}
    CellValue(const char* v) : data_(std::string(v)) {}
    CellValue(std::string v) : data_(std::move(v)) {}

    Type type() const noexcept { return static_cast<Type>(data_.index()); }

    bool isNull() const noexcept { return type() == Type::Null; }
    bool isBool() const noexcept { return type() == Type::Boolean; }
    bool isInteger() const noexcept { return type() == Type::Integer; }
    bool isDouble() const noexcept { return type() == Type::Double; }
    bool isString() const noexcept { return type() == Type::String; }

    // 布尔值不算数值
    bool isNumber() const noexcept { return isInteger() || isDouble(); }

    bool asBool() const;
    int64_t asInteger() const;
    double asNumber() const;
    const std::string& asString() const;

    /**
     * @brief 是否为有效内容：非 null，字符串去空白后非空（数值 0 和 false 保留）
     */
    bool isMeaningful() const;

    /**
     * @brief 标签与摘要使用的展示文本
     *
     * 整数值的 double 不带 ".0"，布尔值输出 true/false，null 输出空串。
     */
    std::string toDisplayString() const;

    bool operator==(const CellValue& other) const { return data_ == other.data_; }
    bool operator!=(const CellValue& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, int64_t, double, std::string> data_;
};

const char* toString(CellValue::Type type) noexcept;

}} // namespace sheetscan::core
