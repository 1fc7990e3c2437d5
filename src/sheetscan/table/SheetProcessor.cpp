#include "sheetscan/table/SheetProcessor.hpp"
#include "sheetscan/utils/CommonUtils.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

namespace sheetscan {
namespace table {

std::vector<Table> SheetProcessor::process(const core::Grid& grid,
                                           const detection::DetectionOptions& options,
                                           TableMode mode) const {
    options.validate();

    utils::CommonUtils::ScopedTimer timer([&grid](double ms) {
        TABLE_DEBUG("Sheet '{}' processed in {:.2f} ms", grid.name(), ms);
    });

    // 紧凑流程的 Gaps 策略使用独立阈值
    const detection::DetectionOptions effective =
        mode == TableMode::Compact ? options.forCompact() : options;

    const detection::RegionList regions = detector_.detect(grid, effective);

    std::vector<Table> tables;
    tables.reserve(regions.size());
    for (size_t i = 0; i < regions.size(); ++i) {
        const std::string id = makeTableId(i);
        if (mode == TableMode::Compact) {
            tables.push_back(compact_.assemble(grid, regions[i], id));
        } else {
            tables.push_back(verbose_.assemble(grid, regions[i], id));
        }
    }

    TABLE_INFO("Sheet '{}': {} table(s) in {} mode", grid.name(), tables.size(), toString(mode));
    return tables;
}

}} // namespace sheetscan::table
