#include "sheetscan/detection/DetectionOptions.hpp"
#include "sheetscan/core/Exception.hpp"
#include "sheetscan/utils/CommonUtils.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <limits>
#include <fmt/format.h>

namespace sheetscan {
namespace detection {

namespace {

bool parseBool(const std::string& key, const std::string& raw) {
    std::string v = utils::CommonUtils::toLower(utils::CommonUtils::trim(raw));
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    SHEETSCAN_THROW_CONFIG(fmt::format("Expected boolean, got '{}'", raw), key);
}

int parseInt(const std::string& key, const std::string& raw) {
    auto v = utils::CommonUtils::parseInteger(raw);
    if (!v || *v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) {
        SHEETSCAN_THROW_CONFIG(fmt::format("Expected integer, got '{}'", raw), key);
    }
    return static_cast<int>(*v);
}

core::FrozenPanes parseFrozenPair(const std::string& key, const std::string& raw) {
    auto pos = raw.find(',');
    if (pos == std::string::npos) {
        SHEETSCAN_THROW_CONFIG(fmt::format("Expected 'rows,cols', got '{}'", raw), key);
    }
    return core::FrozenPanes(parseInt(key, raw.substr(0, pos)), parseInt(key, raw.substr(pos + 1)));
}

} // namespace

DetectionOptions DetectionOptions::fromKeyValues(const std::map<std::string, std::string>& values) {
    DetectionOptions options;

    for (const auto& [key, value] : values) {
        if (key == "table_detection.use_gaps") {
            options.use_gaps = parseBool(key, value);
        } else if (key == "table_detection.gap_threshold") {
            options.gap_threshold = parseInt(key, value);
        } else if (key == "compact.table_detection.gap_threshold") {
            options.compact_gap_threshold = parseInt(key, value);
        } else if (key == "sheet_data.frozen" || key == "sheet_data.frozen_panes") {
            options.frozen = parseFrozenPair(key, value);
        } else if (key == "sheet_data.frozen_panes.frozen_rows") {
            core::FrozenPanes f = options.frozen.value_or(core::FrozenPanes());
            f.rows = parseInt(key, value);
            options.frozen = f;
        } else if (key == "sheet_data.frozen_panes.frozen_cols") {
            core::FrozenPanes f = options.frozen.value_or(core::FrozenPanes());
            f.cols = parseInt(key, value);
            options.frozen = f;
        } else {
            UTILS_WARN("Unknown configuration key '{}' ignored", key);
        }
    }

    options.validate();
    return options;
}

void DetectionOptions::validate() const {
    if (gap_threshold < 1) {
        SHEETSCAN_THROW_CONFIG(fmt::format("gap_threshold must be >= 1, got {}", gap_threshold),
                               "table_detection.gap_threshold");
    }
    if (compact_gap_threshold < 1) {
        SHEETSCAN_THROW_CONFIG(fmt::format("compact gap_threshold must be >= 1, got {}", compact_gap_threshold),
                               "compact.table_detection.gap_threshold");
    }
    if (frozen && (frozen->rows < 0 || frozen->cols < 0)) {
        SHEETSCAN_THROW_CONFIG(fmt::format("frozen panes must be non-negative, got {},{}",
                                           frozen->rows, frozen->cols),
                               "sheet_data.frozen");
    }
}

}} // namespace sheetscan::detection
