#include "sheetscan/detection/TableDetector.hpp"
#include "sheetscan/detection/strategies/FrozenPaneStrategy.hpp"
#include "sheetscan/detection/strategies/FinancialStatementStrategy.hpp"
#include "sheetscan/detection/strategies/BlankRowSeparationStrategy.hpp"
#include "sheetscan/detection/strategies/TemporalHeaderStrategy.hpp"
#include "sheetscan/detection/strategies/ColumnContinuityStrategy.hpp"
#include "sheetscan/detection/strategies/MultiRowHeaderStrategy.hpp"
#include "sheetscan/detection/strategies/GapStrategy.hpp"
#include "sheetscan/detection/strategies/FormattingStrategy.hpp"
#include "sheetscan/detection/strategies/ContentStructureStrategy.hpp"
#include "sheetscan/detection/strategies/DefaultStrategy.hpp"
#include "sheetscan/core/Exception.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

namespace sheetscan {
namespace detection {

TableDetector::StrategyList TableDetector::defaultStrategies() {
    StrategyList list;
    list.push_back(std::make_unique<FrozenPaneStrategy>());
    list.push_back(std::make_unique<FinancialStatementStrategy>());
    list.push_back(std::make_unique<BlankRowSeparationStrategy>());
    list.push_back(std::make_unique<TemporalHeaderStrategy>());
    list.push_back(std::make_unique<ColumnContinuityStrategy>());
    list.push_back(std::make_unique<MultiRowHeaderStrategy>());
    list.push_back(std::make_unique<GapStrategy>());
    list.push_back(std::make_unique<FormattingStrategy>());
    list.push_back(std::make_unique<ContentStructureStrategy>());
    list.push_back(std::make_unique<DefaultStrategy>());
    return list;
}

TableDetector::TableDetector() : strategies_(defaultStrategies()) {}

TableDetector::TableDetector(StrategyList strategies) : strategies_(std::move(strategies)) {
    for (const auto& s : strategies_) {
        if (!s) {
            SHEETSCAN_THROW_PARAM("Strategy list contains a null entry", "strategies");
        }
    }
}

RegionList TableDetector::detect(const core::Grid& grid, const DetectionOptions& options) const {
    const core::SheetBounds& bounds = grid.bounds();

    for (const auto& strategy : strategies_) {
        RegionList regions = strategy->detect(grid, bounds, options);
        if (regions.empty()) {
            DETECT_TRACE("Strategy '{}' found nothing on sheet '{}'", strategy->name(), grid.name());
            continue;
        }

        RegionList validated = validator_.validate(regions, bounds);
        DETECT_DEBUG("Sheet '{}': strategy '{}' produced {} regions ({} after validation)",
                     grid.name(), strategy->name(), regions.size(), validated.size());
        return validated;
    }

    DETECT_DEBUG("Sheet '{}': no table detected", grid.name());
    return {};
}

std::vector<std::string> TableDetector::strategyNames() const {
    std::vector<std::string> names;
    names.reserve(strategies_.size());
    for (const auto& s : strategies_) {
        names.emplace_back(s->name());
    }
    return names;
}

}} // namespace sheetscan::detection
