#include "sheetscan/table/VerboseTableAssembler.hpp"
#include "sheetscan/headers/LabelBuilder.hpp"
#include "sheetscan/utils/CommonUtils.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <map>

namespace sheetscan {
namespace table {

Table VerboseTableAssembler::assemble(const core::Grid& grid, const detection::Region& region,
                                      const std::string& id) const {
    headers::HeaderInfo info = resolver_.resolve(region, region.frozen);
    headers::LabelBuilder labels(grid, info, region.frozen);

    std::vector<Column> columns;
    columns.reserve(static_cast<size_t>(region.colCount()));
    std::map<int, size_t> column_slot;
    for (int col = region.start_col; col <= region.end_col; ++col) {
        Column column;
        column.index = col;
        column.letter = utils::CommonUtils::columnToLetter(col);
        column.label = labels.verboseColumnLabel(col);
        column.is_header = info.isHeaderColumn(col);
        column_slot[col] = columns.size();
        columns.push_back(std::move(column));
    }

    std::vector<Row> rows;
    rows.reserve(static_cast<size_t>(region.rowCount()));
    for (int r = region.start_row; r <= region.end_row; ++r) {
        Row row;
        row.index = r;
        row.label = labels.verboseRowLabel(r);
        row.is_header = info.isHeaderRow(r);

        for (const auto* grid_cell : grid.rowCells(r, region.start_col, region.end_col)) {
            TableCell cell;
            cell.row = grid_cell->row;
            cell.col = grid_cell->col;
            cell.value = grid_cell->value;
            cell.run_length = grid_cell->run_length;
            if (cell.row >= info.data_start_row && cell.col >= info.data_start_col) {
                cell.context = headers::buildHeaderContext(grid, info, cell.row, cell.col);
            }

            Column& column = columns[column_slot[cell.col]];
            column.cells.push_back(cell);
            ++column.populated_count;
            row.cells.push_back(std::move(cell));
            ++row.populated_count;
        }
        rows.push_back(std::move(row));
    }

    const CellCounts counts = countCells(grid, region);
    TableMetadata metadata;
    metadata.detection_method = region.detection_method;
    metadata.cell_count = counts.cells;
    metadata.numeric_cell_count = counts.numeric;
    metadata.has_merged_cells = grid.hasMergedCellsIn(region.start_row, region.end_row,
                                                      region.start_col, region.end_col);

    TABLE_DEBUG("Assembled verbose {} at {} ({}): {} cells, {} numeric",
                id, region.toReference(), region.detection_method, counts.cells, counts.numeric);

    return Table(id, TableMode::Verbose, std::nullopt, region, std::move(info),
                 std::move(columns), std::move(rows), std::move(metadata));
}

}} // namespace sheetscan::table
