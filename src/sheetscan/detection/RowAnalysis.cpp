#include "sheetscan/detection/RowAnalysis.hpp"
#include "sheetscan/utils/CommonUtils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace sheetscan {
namespace detection {

using utils::CommonUtils;

bool RowAnalysis::rowHasData(const core::Grid& grid, int row, int min_col, int max_col) {
    const auto& cells = grid.row(row);
    auto it = cells.lower_bound(min_col);
    return it != cells.end() && it->first <= max_col;
}

bool RowAnalysis::colHasData(const core::Grid& grid, int col, int min_row, int max_row) {
    for (auto it = grid.rows().lower_bound(min_row);
         it != grid.rows().end() && it->first <= max_row; ++it) {
        if (it->second.count(col) > 0) {
            return true;
        }
    }
    return false;
}

std::vector<int> RowAnalysis::dataRows(const core::Grid& grid, const core::SheetBounds& bounds) {
    return grid.populatedRows(bounds.min_row, bounds.max_row, bounds.min_col, bounds.max_col);
}

std::optional<int> RowAnalysis::nextDataRow(const core::Grid& grid, int start_row, int max_row,
                                            int min_col, int max_col) {
    for (auto it = grid.rows().lower_bound(start_row);
         it != grid.rows().end() && it->first <= max_row; ++it) {
        if (rowHasData(grid, it->first, min_col, max_col)) {
            return it->first;
        }
    }
    return std::nullopt;
}

std::pair<int, int> RowAnalysis::dataColumnRange(const core::Grid& grid, int start_row, int end_row,
                                                 int min_col, int max_col) {
    int lo = max_col + 1;
    int hi = min_col - 1;
    for (auto it = grid.rows().lower_bound(start_row);
         it != grid.rows().end() && it->first <= end_row; ++it) {
        auto first = it->second.lower_bound(min_col);
        if (first == it->second.end() || first->first > max_col) {
            continue;
        }
        lo = std::min(lo, first->first);
        auto last = it->second.upper_bound(max_col);
        --last;
        hi = std::max(hi, last->first);
    }
    if (lo > hi) {
        return {min_col, max_col};
    }
    return {lo, hi};
}

bool RowAnalysis::isNumericLike(const core::CellValue& value) {
    if (value.isNumber() || value.isBool()) {
        return true;
    }
    if (!value.isString()) {
        return false;
    }
    const std::string& s = value.asString();
    bool any_digit = false;
    for (char c : s) {
        if (c == '.' || c == '-') continue;
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        any_digit = true;
    }
    return any_digit;
}

bool RowAnalysis::isNumericString(const std::string& value) {
    std::string cleaned;
    cleaned.reserve(value.size());
    for (char c : value) {
        if (c == ',' || c == '$' || c == '%' || c == ' ') continue;
        cleaned.push_back(c);
    }
    return CommonUtils::parseDouble(cleaned).has_value();
}

bool RowAnalysis::isText(const core::CellValue& value) {
    return value.isString() && !isNumericString(value.asString());
}

RowContentPattern RowAnalysis::contentPattern(const core::Grid& grid, int row, int min_col, int max_col) {
    RowContentPattern pattern;
    int numeric = 0;
    int labels = 0;

    for (const auto* cell : grid.rowCells(row, min_col, max_col)) {
        ++pattern.col_count;
        if (isNumericLike(cell->value)) {
            ++numeric;
        } else if (cell->value.isString() &&
                   cell->value.asString().size() >= DetectionConstants::kTextLabelMinLength) {
            ++labels;
        }
    }

    if (pattern.col_count == 0) {
        return pattern;
    }
    pattern.mostly_numeric = numeric * 2 > pattern.col_count;
    pattern.has_text_labels = labels >= DetectionConstants::kTextLabelMinCount;
    return pattern;
}

ColumnPattern RowAnalysis::columnPattern(const core::Grid& grid, int row, int min_col, int max_col) {
    ColumnPattern pattern;
    auto cells = grid.rowCells(row, min_col, max_col);
    if (cells.empty()) {
        return pattern;
    }

    int numeric = 0;
    int text = 0;
    for (const auto* cell : cells) {
        if (cell->value.isNumber() || cell->value.isBool() ||
            (cell->value.isString() && isNumericString(cell->value.asString()))) {
            ++numeric;
        } else if (cell->value.isString()) {
            ++text;
        }
    }

    const double total = static_cast<double>(cells.size());
    const int total_cols = max_col - min_col + 1;
    pattern.col_count = static_cast<int>(cells.size());
    pattern.numeric_ratio = numeric / total;
    pattern.text_ratio = text / total;
    pattern.column_span = cells.back()->col - cells.front()->col + 1;
    pattern.density = total_cols > 0 ? pattern.col_count / static_cast<double>(total_cols) : 0.0;
    return pattern;
}

bool RowAnalysis::isTemporalText(const std::string& text) {
    static const std::regex iso_date(R"(20\d{2}-\d{2}-\d{2})");
    static const std::regex month_n(R"(month\s+\d+)", std::regex::icase);
    return std::regex_search(text, iso_date) || std::regex_search(text, month_n);
}

bool RowAnalysis::isDateHeaderText(const std::string& text) {
    if (isTemporalText(text)) {
        return true;
    }
    static const std::regex month_year(
        R"(\b(jan(uary)?|feb(ruary)?|mar(ch)?|apr(il)?|may|june?|july?|aug(ust)?|sep(t(ember)?)?|oct(ober)?|nov(ember)?|dec(ember)?)\.?[\s,\-]+(19|20)\d{2}\b)",
        std::regex::icase);
    static const std::regex quarter_year(R"(\bq[1-4][\s\-]+(19|20)\d{2}\b)", std::regex::icase);
    return std::regex_search(text, month_year) || std::regex_search(text, quarter_year);
}

template<typename Matcher>
bool RowAnalysis::matchesTemporalRatio(const core::Grid& grid, int row, int min_col, int max_col,
                                       Matcher&& matcher) {
    auto cells = grid.rowCells(row, min_col, max_col);
    if (cells.empty()) {
        return false;
    }

    int considered = 0;
    int matched = 0;
    for (const auto* cell : cells) {
        bool is_row_label = cell->col == min_col && cells.size() > 1 && isText(cell->value);
        if (is_row_label) {
            continue;
        }
        ++considered;
        if (matcher(cell->value.toDisplayString())) {
            ++matched;
        }
    }

    if (considered == 0) {
        return false;
    }
    return static_cast<double>(matched) / considered >= DetectionConstants::kTemporalMinRatio;
}

bool RowAnalysis::isTemporalRow(const core::Grid& grid, int row, int min_col, int max_col) {
    return matchesTemporalRatio(grid, row, min_col, max_col,
                                [](const std::string& s) { return isTemporalText(s); });
}

bool RowAnalysis::isDateHeaderRow(const core::Grid& grid, int row, int min_col, int max_col) {
    return matchesTemporalRatio(grid, row, min_col, max_col,
                                [](const std::string& s) { return isDateHeaderText(s); });
}

bool RowAnalysis::isSectionHeaderRow(const core::Grid& grid, int row, int min_col, int max_col) {
    auto cells = grid.rowCells(row, min_col, max_col);
    return cells.size() == 1 && cells.front()->col == min_col && isText(cells.front()->value);
}

}} // namespace sheetscan::detection
