#include "sheetscan/detection/RegionValidator.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <algorithm>

namespace sheetscan {
namespace detection {

Region RegionValidator::clip(const Region& region, const core::SheetBounds& bounds) {
    Region out(region);
    out.start_row = std::max(region.start_row, bounds.min_row);
    out.end_row = std::min(region.end_row, bounds.max_row);
    out.start_col = std::max(region.start_col, bounds.min_col);
    out.end_col = std::min(region.end_col, bounds.max_col);
    return out;
}

RegionList RegionValidator::validate(const RegionList& regions, const core::SheetBounds& bounds) const {
    RegionList cleaned;
    cleaned.reserve(regions.size());

    for (const auto& region : regions) {
        Region clipped = clip(region, bounds);
        if (!clipped.isValid()) {
            DETECT_DEBUG("Dropping empty region rows {}..{} cols {}..{} ({})",
                         region.start_row, region.end_row, region.start_col, region.end_col,
                         region.detection_method);
            continue;
        }
        if (clipped.detection_method.empty()) {
            clipped.detection_method = "unknown";
        }
        cleaned.push_back(std::move(clipped));
    }
    return cleaned;
}

}} // namespace sheetscan::detection
