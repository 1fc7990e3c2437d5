#include "sheetscan/table/CompactTableAssembler.hpp"
#include "sheetscan/headers/LabelBuilder.hpp"
#include "sheetscan/utils/CommonUtils.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace sheetscan {
namespace table {

Table CompactTableAssembler::assemble(const core::Grid& grid, const detection::Region& region,
                                      const std::string& id) const {
    TitleResult titled = title_detector_.detect(grid, region);
    const detection::Region& adjusted = titled.region;

    headers::HeaderInfo info = resolver_.resolve(adjusted, adjusted.frozen);
    headers::LabelBuilder labels(grid, info, adjusted.frozen);

    std::vector<Column> columns;
    columns.reserve(static_cast<size_t>(adjusted.colCount()));
    for (int col = adjusted.start_col; col <= adjusted.end_col; ++col) {
        Column column;
        column.index = col;
        column.letter = utils::CommonUtils::columnToLetter(col);
        column.label = labels.compactColumnLabel(col);
        column.is_header = info.isHeaderColumn(col);
        columns.push_back(std::move(column));
    }

    std::vector<Row> rows;
    rows.reserve(static_cast<size_t>(adjusted.rowCount()));
    for (int r = adjusted.start_row; r <= adjusted.end_row; ++r) {
        Row row;
        row.index = r;
        row.label = labels.compactRowLabel(r);
        row.is_header = info.isHeaderRow(r);
        for (const auto* cell : grid.rowCells(r, adjusted.start_col, adjusted.end_col)) {
            // 游程覆盖的每一列各计一次，超出区域的部分不计
            const int weight = clippedRunWeight(*cell, adjusted.start_col, adjusted.end_col);
            row.populated_count += weight;
            for (int c = cell->col; c < cell->col + weight; ++c) {
                ++columns[static_cast<size_t>(c - adjusted.start_col)].populated_count;
            }
        }
        rows.push_back(std::move(row));
    }

    // 计数覆盖检测到的原始区域，标题行也计入
    const CellCounts counts = countCells(grid, region);
    TableMetadata metadata;
    metadata.detection_method = region.detection_method;
    metadata.cell_count = counts.cells;
    metadata.numeric_cell_count = counts.numeric;
    metadata.has_merged_cells = grid.hasMergedCellsIn(region.start_row, region.end_row,
                                                      region.start_col, region.end_col);

    TABLE_DEBUG("Assembled compact {} at {} ({}){}: {} cells, {} numeric",
                id, adjusted.toReference(), adjusted.detection_method,
                titled.title ? fmt::format(" titled '{}'", *titled.title) : std::string(),
                counts.cells, counts.numeric);

    return Table(id, TableMode::Compact, std::move(titled.title), adjusted, std::move(info),
                 std::move(columns), std::move(rows), std::move(metadata));
}

}} // namespace sheetscan::table
