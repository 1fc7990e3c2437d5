#include "sheetscan/table/TableFormatter.hpp"
#include "sheetscan/core/ErrorCode.hpp"

#include <fmt/format.h>

namespace sheetscan {
namespace table {

namespace {

std::string joinPath(const std::vector<std::string>& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += " > ";
        out += path[i];
    }
    return out;
}

std::string joinInts(const std::vector<int>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += std::to_string(values[i]);
    }
    return out + "]";
}

} // namespace

std::string TableFormatter::format(const Table& table) const {
    const auto& meta = table.metadata();
    const auto& info = table.headerInfo();

    std::string out = fmt::format("{} {} [{}] method={} cells={} numeric={}{}\n",
                                  table.id(), table.region().toReference(), toString(table.mode()),
                                  meta.detection_method, meta.cell_count, meta.numeric_cell_count,
                                  meta.has_merged_cells ? " merged" : "");
    if (table.title()) {
        out += fmt::format("  title: {}\n", *table.title());
    }
    out += fmt::format("  header rows: {}  header columns: {}  data starts at row {} col {}\n",
                       joinInts(info.header_rows), joinInts(info.header_columns),
                       info.data_start_row, info.data_start_col);

    out += "  columns:";
    for (const auto& column : table.columns()) {
        out += fmt::format(" {}={}", column.letter, column.label);
        if (column.is_header) out += "*";
    }
    out += "\n";

    size_t listed = 0;
    for (const auto& row : table.rows()) {
        if (row.is_header || row.populated_count == 0) {
            continue;
        }
        if (options_.max_rows > 0 && listed >= options_.max_rows) {
            out += fmt::format("  ... ({} rows total)\n", table.rows().size());
            break;
        }
        out += fmt::format("  row {:>5}: {} ({} cells)\n", row.index, row.label, row.populated_count);
        ++listed;

        if (options_.show_header_context) {
            for (const auto& cell : row.cells) {
                if (!cell.context) continue;
                out += fmt::format("      {} = {}  [{} | {}]\n",
                                   cell.col, cell.value.toDisplayString(),
                                   joinPath(cell.context->column_path), joinPath(cell.context->row_path));
            }
        }
    }
    return out;
}

std::string TableFormatter::formatSheet(const SheetResult& sheet) const {
    std::string out = fmt::format("== {} ==\n", sheet.sheet_name.empty() ? "<unnamed>" : sheet.sheet_name);
    if (!sheet.ok()) {
        out += fmt::format("  error [{}]: {}\n", core::toString(sheet.error->code), sheet.error->fullMessage());
        return out;
    }
    if (sheet.tables.empty()) {
        out += "  (no tables)\n";
        return out;
    }
    for (const auto& table : sheet.tables) {
        out += format(table);
    }
    return out;
}

std::string TableFormatter::formatWorkbook(const std::vector<SheetResult>& sheets) const {
    std::string out;
    for (const auto& sheet : sheets) {
        out += formatSheet(sheet);
    }
    return out;
}

}} // namespace sheetscan::table
