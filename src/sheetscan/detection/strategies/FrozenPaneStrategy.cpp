#include "sheetscan/detection/strategies/FrozenPaneStrategy.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

namespace sheetscan {
namespace detection {

RegionList FrozenPaneStrategy::detect(const core::Grid& grid,
                                      const core::SheetBounds& bounds,
                                      const DetectionOptions& options) const {
    const core::FrozenPanes frozen = options.effectiveFrozen(grid);
    if (!frozen.any()) {
        return {};
    }

    DETECT_DEBUG("Frozen panes {} rows / {} cols, whole sheet is one table", frozen.rows, frozen.cols);
    Region region = Region::wholeBounds(bounds, name());
    region.frozen = frozen;
    return {region};
}

}} // namespace sheetscan::detection
