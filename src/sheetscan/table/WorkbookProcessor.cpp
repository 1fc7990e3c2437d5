#include "sheetscan/table/WorkbookProcessor.hpp"
#include "sheetscan/core/Exception.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <future>
#include <fmt/format.h>

namespace sheetscan {
namespace table {

WorkbookProcessor::WorkbookProcessor(size_t threads) {
    if (threads != 1) {
        pool_ = std::make_unique<core::ThreadPool>(threads);
    }
    TABLE_DEBUG("WorkbookProcessor created with {} thread(s)", threadCount());
}

WorkbookProcessor::~WorkbookProcessor() {
    shutdown();
}

void WorkbookProcessor::shutdown() {
    if (pool_) {
        pool_->shutdown();
    }
}

SheetResult WorkbookProcessor::processOne(const core::Grid& grid,
                                          const detection::DetectionOptions& options,
                                          TableMode mode) const {
    SheetResult result;
    result.sheet_name = grid.name();
    try {
        result.tables = processor_.process(grid, options, mode);
    } catch (const core::SheetScanException& e) {
        TABLE_ERROR("Sheet '{}' failed: {}", grid.name(), e.getDetailedMessage());
        core::Error error = e.toError();
        error.context = error.context.empty() ? grid.name()
                                              : fmt::format("{}; {}", grid.name(), error.context);
        result.error = std::move(error);
    } catch (const std::exception& e) {
        TABLE_ERROR("Sheet '{}' failed: {}", grid.name(), e.what());
        result.error = core::makeError(core::ErrorCode::InternalError, e.what(), grid.name());
    }
    return result;
}

std::vector<SheetResult> WorkbookProcessor::process(const std::vector<core::Grid>& sheets,
                                                    const detection::DetectionOptions& options,
                                                    TableMode mode) {
    std::vector<SheetResult> results;
    results.reserve(sheets.size());

    if (!pool_) {
        for (const auto& sheet : sheets) {
            results.push_back(processOne(sheet, options, mode));
        }
        return results;
    }

    std::vector<std::future<SheetResult>> futures;
    futures.reserve(sheets.size());
    for (const auto& sheet : sheets) {
        futures.push_back(pool_->enqueue([this, &sheet, &options, mode]() {
            return processOne(sheet, options, mode);
        }));
    }
    for (auto& future : futures) {
        results.push_back(future.get());
    }

    size_t failed = 0;
    for (const auto& r : results) {
        if (!r.ok()) ++failed;
    }
    TABLE_INFO("Workbook processed: {} sheet(s), {} failed", results.size(), failed);
    return results;
}

}} // namespace sheetscan::table
