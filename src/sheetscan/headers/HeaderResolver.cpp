#include "sheetscan/headers/HeaderResolver.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <algorithm>

namespace sheetscan {
namespace headers {

namespace {

std::vector<int> pickHeaders(int start, int end, int frozen_count) {
    std::vector<int> out;
    if (start > end) {
        return out;
    }
    if (frozen_count > 0) {
        const int last = std::min(end, start + frozen_count - 1);
        for (int i = start; i <= last; ++i) {
            out.push_back(i);
        }
        return out;
    }
    if (end > start) {
        out.push_back(start);
    }
    return out;
}

} // namespace

bool HeaderInfo::isHeaderRow(int row) const {
    return std::find(header_rows.begin(), header_rows.end(), row) != header_rows.end();
}

bool HeaderInfo::isHeaderColumn(int col) const {
    return std::find(header_columns.begin(), header_columns.end(), col) != header_columns.end();
}

HeaderInfo HeaderResolver::resolve(const detection::Region& region, const core::FrozenPanes& frozen) const {
    HeaderInfo info;
    info.header_rows = pickHeaders(region.start_row, region.end_row, frozen.rows);
    info.header_columns = pickHeaders(region.start_col, region.end_col, frozen.cols);
    info.data_start_row = region.start_row + static_cast<int>(info.header_rows.size());
    info.data_start_col = region.start_col + static_cast<int>(info.header_columns.size());

    HEADER_DEBUG("Region {}: {} header rows, {} header columns, data starts at ({}, {})",
                 region.toReference(), info.header_rows.size(), info.header_columns.size(),
                 info.data_start_row, info.data_start_col);
    return info;
}

}} // namespace sheetscan::headers
