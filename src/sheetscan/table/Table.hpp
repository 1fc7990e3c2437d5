#pragma once

#include <optional>
#include <string>
#include <vector>
#include "sheetscan/core/Grid.hpp"
#include "sheetscan/detection/Region.hpp"
#include "sheetscan/headers/HeaderContext.hpp"
#include "sheetscan/headers/HeaderResolver.hpp"

namespace sheetscan {
namespace table {

enum class TableMode {
    Verbose,   // 完整单元格映射 + 表头上下文
    Compact    // 只保留计数与标签
};

const char* toString(TableMode mode) noexcept;

/**
 * @brief 表格中的单元格（详细模式）
 *
 * 表头单元格没有 context。
 */
struct TableCell {
    int row = 0;
    int col = 0;
    core::CellValue value;
    int run_length = 1;
    std::optional<headers::HeaderContext> context;
};

/**
 * @brief 表格列
 *
 * 详细模式下 cells 为该列在区域内的全部单元格（按行升序）；
 * 紧凑模式下 cells 为空，只填写 populated_count。
 */
struct Column {
    int index = 0;
    std::string letter;
    std::string label;
    bool is_header = false;
    std::vector<TableCell> cells;
    int populated_count = 0;
};

/**
 * @brief 表格行，结构同 Column
 */
struct Row {
    int index = 0;
    std::string label;
    bool is_header = false;
    std::vector<TableCell> cells;
    int populated_count = 0;
};

struct TableMetadata {
    std::string detection_method;
    int cell_count = 0;
    int numeric_cell_count = 0;
    bool has_merged_cells = false;
};

/**
 * @brief 组装完成的表格
 *
 * 由 VerboseTableAssembler / CompactTableAssembler 构建，构建后只读。
 */
class Table {
public:
    Table(std::string id, TableMode mode, std::optional<std::string> title,
          detection::Region region, headers::HeaderInfo header_info,
          std::vector<Column> columns, std::vector<Row> rows, TableMetadata metadata)
        : id_(std::move(id)), mode_(mode), title_(std::move(title)), region_(std::move(region)),
          header_info_(std::move(header_info)), columns_(std::move(columns)),
          rows_(std::move(rows)), metadata_(std::move(metadata)) {}

    const std::string& id() const noexcept { return id_; }
    TableMode mode() const noexcept { return mode_; }
    const std::optional<std::string>& title() const noexcept { return title_; }
    const detection::Region& region() const noexcept { return region_; }
    const headers::HeaderInfo& headerInfo() const noexcept { return header_info_; }
    const std::vector<Column>& columns() const noexcept { return columns_; }
    const std::vector<Row>& rows() const noexcept { return rows_; }
    const TableMetadata& metadata() const noexcept { return metadata_; }

    /**
     * @brief 按工作表列号查找列
     * @return 不在表格内时返回 nullptr
     */
    const Column* findColumn(int col) const;
    const Row* findRow(int row) const;

    /**
     * @brief 全部列标签，按列顺序
     */
    std::vector<std::string> columnLabels() const;

    /**
     * @brief 详细模式下查找单元格；紧凑模式或未找到返回 nullptr
     */
    const TableCell* findCell(int row, int col) const;

private:
    std::string id_;
    TableMode mode_;
    std::optional<std::string> title_;
    detection::Region region_;
    headers::HeaderInfo header_info_;
    std::vector<Column> columns_;
    std::vector<Row> rows_;
    TableMetadata metadata_;
};

/**
 * @brief 区域内单元格计数
 *
 * RLE 游程按落在区域列范围内的长度计数；布尔值不算数值。
 */
struct CellCounts {
    int cells = 0;
    int numeric = 0;
};

CellCounts countCells(const core::Grid& grid, const detection::Region& region);

/**
 * @brief 单元格（或游程）在 [start_col, end_col] 内覆盖的列数，不相交时为 0
 */
int clippedRunWeight(const core::GridCell& cell, int start_col, int end_col);

/**
 * @brief 第 index 个表格（0开始）的 id："table_1"、"table_2"...
 */
std::string makeTableId(size_t index);

}} // namespace sheetscan::table
