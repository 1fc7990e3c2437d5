#pragma once

#include <vector>
#include "sheetscan/core/Grid.hpp"
#include "sheetscan/detection/DetectionOptions.hpp"
#include "sheetscan/detection/TableDetector.hpp"
#include "sheetscan/table/CompactTableAssembler.hpp"
#include "sheetscan/table/Table.hpp"
#include "sheetscan/table/VerboseTableAssembler.hpp"

namespace sheetscan {
namespace table {

/**
 * @brief 单张工作表的处理流水线
 *
 * Grid → TableDetector → 每个区域组装一个 Table。
 * 处理器本身无状态，可在多个线程上共享。
 */
class SheetProcessor {
public:
    SheetProcessor() = default;
    explicit SheetProcessor(detection::TableDetector detector) : detector_(std::move(detector)) {}

    /**
     * @brief 处理一张工作表
     * @return 检测顺序的表格，id 依次为 table_1..N；空网格返回空列表
     * @throws ParameterException 配置非法
     */
    std::vector<Table> process(const core::Grid& grid,
                               const detection::DetectionOptions& options,
                               TableMode mode = TableMode::Verbose) const;

    const detection::TableDetector& detector() const noexcept { return detector_; }

private:
    detection::TableDetector detector_;
    VerboseTableAssembler verbose_;
    CompactTableAssembler compact_;
};

}} // namespace sheetscan::table
