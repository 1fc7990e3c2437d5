#include "sheetscan/detection/Region.hpp"
#include "sheetscan/utils/CommonUtils.hpp"

namespace sheetscan {
namespace detection {

std::string Region::toReference() const {
    if (!isValid() || start_row < 1 || start_col < 1) {
        return "<empty>";
    }
    return utils::CommonUtils::rangeReference(start_row, start_col, end_row, end_col);
}

}} // namespace sheetscan::detection
