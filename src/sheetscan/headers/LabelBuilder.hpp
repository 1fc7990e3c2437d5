#pragma once

#include <string>
#include "sheetscan/core/Grid.hpp"
#include "sheetscan/headers/HeaderResolver.hpp"

namespace sheetscan {
namespace headers {

/**
 * @brief 列/行标签生成
 *
 * 详细模式：
 * - 列标签：该列在各表头行的值，倒序后用空格连接（"Jan 2023"）
 * - 行标签：每个表头列一段，多段用 " | " 连接；有冻结行且表头行多于一行时，
 *   每段取该表头列在所有表头行的值（倒序、空格连接），否则取当前行的值
 *
 * 紧凑模式：不倒序，表头值用 " | " 连接，行标签没有冻结重复规则。
 *
 * 没有任何表头值时返回 "unlabeled"。
 */
class LabelBuilder {
public:
    static constexpr const char* kUnlabeled = "unlabeled";

    LabelBuilder(const core::Grid& grid, const HeaderInfo& header_info, const core::FrozenPanes& frozen)
        : grid_(grid), header_info_(header_info), frozen_(frozen) {}

    std::string verboseColumnLabel(int col) const;
    std::string verboseRowLabel(int row) const;

    std::string compactColumnLabel(int col) const;
    std::string compactRowLabel(int row) const;

private:
    // 单元格展示文本，不存在时返回空串
    std::string valueAt(int row, int col) const;

    const core::Grid& grid_;
    const HeaderInfo& header_info_;
    core::FrozenPanes frozen_;
};

}} // namespace sheetscan::headers
