#include "sheetscan/table/TitleDetector.hpp"
#include "sheetscan/detection/RowAnalysis.hpp"
#include "sheetscan/utils/CommonUtils.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <array>
#include <cctype>

namespace sheetscan {
namespace table {

using utils::CommonUtils;

namespace {

const std::array<const char*, 24> kMonthTokens = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec",
    "january", "february", "march", "april", "june", "july", "august",
    "september", "sept", "october", "november", "december"
};

bool isYearToken(const std::string& token) {
    if (token.size() != 4 || token[0] != '2' || token[1] != '0') {
        return false;
    }
    return std::isdigit(static_cast<unsigned char>(token[2])) &&
           std::isdigit(static_cast<unsigned char>(token[3]));
}

bool isMonthToken(const std::string& token) {
    const std::string lower = CommonUtils::toLower(token);
    for (const char* month : kMonthTokens) {
        if (lower == month) {
            return true;
        }
    }
    return false;
}

} // namespace

bool TitleDetector::isTitleText(const std::string& raw) {
    const std::string text = CommonUtils::trim(raw);
    if (text.size() < kMinTitleLength || text.size() > kMaxTitleLength) {
        return false;
    }
    if (!CommonUtils::hasLetter(text) || CommonUtils::isDigitsOrPunctuation(text)) {
        return false;
    }
    for (const auto& token : CommonUtils::tokenize(text)) {
        if (isYearToken(token) || isMonthToken(token)) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> TitleDetector::titleAt(const core::Grid& grid, int row,
                                                  int start_col, int end_col) const {
    auto cells = grid.rowCells(row, start_col, end_col);
    if (cells.size() != 1 || cells.front()->col != start_col) {
        return std::nullopt;
    }
    const core::CellValue& value = cells.front()->value;
    if (!detection::RowAnalysis::isText(value) || !isTitleText(value.asString())) {
        return std::nullopt;
    }
    return CommonUtils::trim(value.asString());
}

TitleResult TitleDetector::detect(const core::Grid& grid, const detection::Region& region) const {
    TitleResult result;
    result.region = region;
    if (!region.isValid()) {
        return result;
    }

    const int above = region.start_row - 1;
    if (above >= grid.bounds().min_row) {
        if (auto title = titleAt(grid, above, region.start_col, region.end_col)) {
            TABLE_DEBUG("Title '{}' found above region {}", *title, region.toReference());
            result.title = std::move(title);
            return result;
        }
    }

    if (auto title = titleAt(grid, region.start_row, region.start_col, region.end_col)) {
        TABLE_DEBUG("Title '{}' found on first row of region {}", *title, region.toReference());
        result.title = std::move(title);
        // 只有一行的区域不下移
        if (region.rowCount() > 1) {
            ++result.region.start_row;
            result.shifted = true;
        }
    }
    return result;
}

}} // namespace sheetscan::table
