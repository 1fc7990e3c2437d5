#include "sheetscan/detection/strategies/FinancialStatementStrategy.hpp"
#include "sheetscan/detection/RowAnalysis.hpp"
#include "sheetscan/utils/CommonUtils.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

namespace sheetscan {
namespace detection {

namespace {

const char* const kFinancialTerms[] = {
    "assets", "liabilities", "equity", "revenue", "expenses", "income",
    "cash", "receivable", "payable", "inventory", "property", "debt",
    "retained", "earnings", "capital", "current", "non-current", "total"
};

} // namespace

bool FinancialStatementStrategy::containsFinancialTerm(const std::string& text) {
    const std::string lower = utils::CommonUtils::toLower(text);
    for (const char* term : kFinancialTerms) {
        if (lower.find(term) != std::string::npos) {
            return true;
        }
    }
    return false;
}

RegionList FinancialStatementStrategy::detect(const core::Grid& grid,
                                              const core::SheetBounds& bounds,
                                              const DetectionOptions& /*options*/) const {
    const int first_col = bounds.min_col;
    const std::vector<int> rows = RowAnalysis::dataRows(grid, bounds);
    if (rows.empty()) {
        return {};
    }

    std::vector<std::string> section_texts;
    int data_rows = 0;

    for (int row : rows) {
        const core::GridCell* label = grid.find(row, first_col);
        if (label == nullptr || !RowAnalysis::isText(label->value)) {
            continue;
        }
        const int others = static_cast<int>(grid.rowCells(row, first_col + 1, bounds.max_col).size());
        if (others == 0) {
            section_texts.push_back(label->value.asString());
        } else if (others >= DetectionConstants::kFinancialMinOtherCells) {
            ++data_rows;
        }
    }

    if (static_cast<int>(section_texts.size()) < DetectionConstants::kFinancialMinSections ||
        data_rows < DetectionConstants::kFinancialMinDataRows) {
        return {};
    }

    int with_terms = 0;
    for (const auto& text : section_texts) {
        if (containsFinancialTerm(text)) {
            ++with_terms;
        }
    }
    const double ratio = static_cast<double>(with_terms) / section_texts.size();
    if (ratio < DetectionConstants::kFinancialTermRatio) {
        DETECT_TRACE("Financial layout rejected: {}/{} section headers use financial terms",
                     with_terms, section_texts.size());
        return {};
    }

    const int start_row = rows.front();
    const int end_row = rows.back();
    auto [start_col, end_col] = RowAnalysis::dataColumnRange(grid, start_row, end_row,
                                                             bounds.min_col, bounds.max_col);

    DETECT_DEBUG("Financial statement: {} sections, {} data rows", section_texts.size(), data_rows);
    return {Region(start_row, end_row, start_col, end_col, name())};
}

}} // namespace sheetscan::detection
