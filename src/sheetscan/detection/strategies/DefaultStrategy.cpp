#include "sheetscan/detection/strategies/DefaultStrategy.hpp"

namespace sheetscan {
namespace detection {

RegionList DefaultStrategy::detect(const core::Grid& grid,
                                   const core::SheetBounds& bounds,
                                   const DetectionOptions& /*options*/) const {
    if (grid.empty()) {
        return {};
    }
    return {Region::wholeBounds(bounds, name())};
}

}} // namespace sheetscan::detection
