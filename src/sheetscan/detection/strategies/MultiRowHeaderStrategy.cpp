#include "sheetscan/detection/strategies/MultiRowHeaderStrategy.hpp"
#include "sheetscan/detection/RowAnalysis.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <algorithm>

namespace sheetscan {
namespace detection {

namespace {

struct HeaderBlock {
    int start_row;
    int end_row;
};

bool isHeaderLikeRow(const core::Grid& grid, int row, int min_col, int max_col) {
    const RowContentPattern p = RowAnalysis::contentPattern(grid, row, min_col, max_col);
    return p.isHeaderLike() && p.col_count >= DetectionConstants::kMultirowMinColumns;
}

std::vector<HeaderBlock> findHeaderBlocks(const core::Grid& grid, int min_row, int max_row,
                                          int min_col, int max_col) {
    std::vector<HeaderBlock> blocks;
    int block_start = 0;
    bool in_block = false;

    auto close_block = [&](int last_row) {
        if (in_block && last_row - block_start + 1 >= DetectionConstants::kMultirowMinBlockRows) {
            blocks.push_back({block_start, last_row});
        }
        in_block = false;
    };

    for (int row = min_row; row <= max_row; ++row) {
        if (RowAnalysis::rowHasData(grid, row, min_col, max_col) &&
            isHeaderLikeRow(grid, row, min_col, max_col)) {
            if (!in_block) {
                block_start = row;
                in_block = true;
            }
        } else {
            close_block(row - 1);
        }
    }
    close_block(max_row);
    return blocks;
}

// 从 start_row 起的 3 行中至少 2 行像表头
bool looksLikeNewHeaderBlock(const core::Grid& grid, int start_row, int max_row, int min_col, int max_col) {
    int header_like = 0;
    const int end = std::min(start_row + DetectionConstants::kMultirowLookaheadRows - 1, max_row);
    for (int row = start_row; row <= end; ++row) {
        if (RowAnalysis::rowHasData(grid, row, min_col, max_col) &&
            RowAnalysis::contentPattern(grid, row, min_col, max_col).isHeaderLike()) {
            ++header_like;
        }
    }
    return header_like >= 2;
}

int findTableEnd(const core::Grid& grid, int data_start, int max_row, int min_col, int max_col) {
    int last_data_row = data_start;

    for (int row = data_start + 1; row <= max_row; ++row) {
        if (RowAnalysis::rowHasData(grid, row, min_col, max_col)) {
            if (isHeaderLikeRow(grid, row, min_col, max_col) &&
                looksLikeNewHeaderBlock(grid, row, max_row, min_col, max_col)) {
                break;
            }
            last_data_row = row;
        } else {
            auto next = RowAnalysis::nextDataRow(grid, row + 1, max_row, min_col, max_col);
            if (next && *next - row > DetectionConstants::kMultirowMaxGap) {
                break;
            }
        }
    }
    return last_data_row;
}

} // namespace

RegionList MultiRowHeaderStrategy::detect(const core::Grid& grid,
                                          const core::SheetBounds& bounds,
                                          const DetectionOptions& /*options*/) const {
    const int scan_end = std::min(bounds.min_row + DetectionConstants::kMultirowScanExtraRows, bounds.max_row);
    const auto blocks = findHeaderBlocks(grid, bounds.min_row, scan_end, bounds.min_col, bounds.max_col);
    if (blocks.empty()) {
        return {};
    }

    RegionList regions;
    for (const auto& block : blocks) {
        auto data_start = RowAnalysis::nextDataRow(grid, block.end_row + 1, bounds.max_row,
                                                   bounds.min_col, bounds.max_col);
        if (!data_start) {
            continue;
        }
        const int end_row = findTableEnd(grid, *data_start, bounds.max_row, bounds.min_col, bounds.max_col);
        if (end_row >= *data_start) {
            regions.emplace_back(block.start_row, end_row, bounds.min_col, bounds.max_col, name());
            DETECT_TRACE("Header block rows {}..{}, data from row {} to {}",
                         block.start_row, block.end_row, *data_start, end_row);
        }
    }
    return regions;
}

}} // namespace sheetscan::detection
