#include "sheetscan/headers/HeaderContext.hpp"

namespace sheetscan {
namespace headers {

HeaderContext buildHeaderContext(const core::Grid& grid, const HeaderInfo& info, int row, int col) {
    HeaderContext ctx;

    for (int header_row : info.header_rows) {
        if (const core::GridCell* cell = grid.find(header_row, col)) {
            ctx.column_path.push_back(cell->value.toDisplayString());
        }
    }
    for (int header_col : info.header_columns) {
        if (const core::GridCell* cell = grid.find(row, header_col)) {
            ctx.row_path.push_back(cell->value.toDisplayString());
        }
    }

    if (!ctx.column_path.empty()) {
        ctx.primary_column_header = ctx.column_path.front();
    }
    if (!ctx.row_path.empty()) {
        ctx.primary_row_header = ctx.row_path.front();
    }
    ctx.column_levels = static_cast<int>(ctx.column_path.size());
    ctx.row_levels = static_cast<int>(ctx.row_path.size());
    return ctx;
}

}} // namespace sheetscan::headers
