#include "sheetscan/headers/LabelBuilder.hpp"

#include <algorithm>
#include <vector>

namespace sheetscan {
namespace headers {

namespace {

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

std::string orUnlabeled(std::string label) {
    return label.empty() ? std::string(LabelBuilder::kUnlabeled) : label;
}

} // namespace

std::string LabelBuilder::valueAt(int row, int col) const {
    const core::GridCell* cell = grid_.find(row, col);
    return cell == nullptr ? std::string() : cell->value.toDisplayString();
}

std::string LabelBuilder::verboseColumnLabel(int col) const {
    std::vector<std::string> parts;
    for (int header_row : header_info_.header_rows) {
        std::string v = valueAt(header_row, col);
        if (!v.empty()) {
            parts.push_back(std::move(v));
        }
    }
    std::reverse(parts.begin(), parts.end());
    return orUnlabeled(join(parts, " "));
}

std::string LabelBuilder::verboseRowLabel(int row) const {
    const bool frozen_block = frozen_.rows > 0 && header_info_.header_rows.size() > 1;

    std::vector<std::string> segments;
    for (int header_col : header_info_.header_columns) {
        if (frozen_block) {
            // 冻结表头块里表头列的内容对块内每一行都相同
            std::vector<std::string> parts;
            for (int header_row : header_info_.header_rows) {
                std::string v = valueAt(header_row, header_col);
                if (!v.empty()) {
                    parts.push_back(std::move(v));
                }
            }
            std::reverse(parts.begin(), parts.end());
            if (!parts.empty()) {
                segments.push_back(join(parts, " "));
            }
        } else {
            std::string v = valueAt(row, header_col);
            if (!v.empty()) {
                segments.push_back(std::move(v));
            }
        }
    }
    return orUnlabeled(join(segments, " | "));
}

std::string LabelBuilder::compactColumnLabel(int col) const {
    std::vector<std::string> parts;
    for (int header_row : header_info_.header_rows) {
        std::string v = valueAt(header_row, col);
        if (!v.empty()) {
            parts.push_back(std::move(v));
        }
    }
    return orUnlabeled(join(parts, " | "));
}

std::string LabelBuilder::compactRowLabel(int row) const {
    std::vector<std::string> parts;
    for (int header_col : header_info_.header_columns) {
        std::string v = valueAt(row, header_col);
        if (!v.empty()) {
            parts.push_back(std::move(v));
        }
    }
    return orUnlabeled(join(parts, " | "));
}

}} // namespace sheetscan::headers
