#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "sheetscan/core/ErrorCode.hpp"
#include "sheetscan/core/Grid.hpp"
#include "sheetscan/core/ThreadPool.hpp"
#include "sheetscan/table/SheetProcessor.hpp"

namespace sheetscan {
namespace table {

/**
 * @brief 单张工作表的处理结果
 *
 * 工作表处理抛出异常时 error 有值、tables 为空，不影响其他工作表。
 */
struct SheetResult {
    std::string sheet_name;
    std::vector<Table> tables;
    std::optional<core::Error> error;

    bool ok() const noexcept { return !error.has_value(); }
};

/**
 * @brief 工作簿处理：多张工作表并行，结果按输入顺序返回
 */
class WorkbookProcessor {
public:
    /**
     * @param threads 工作线程数；1 表示在调用线程上顺序处理，0 表示硬件并发数
     */
    explicit WorkbookProcessor(size_t threads = 0);
    ~WorkbookProcessor();

    WorkbookProcessor(const WorkbookProcessor&) = delete;
    WorkbookProcessor& operator=(const WorkbookProcessor&) = delete;

    std::vector<SheetResult> process(const std::vector<core::Grid>& sheets,
                                     const detection::DetectionOptions& options,
                                     TableMode mode = TableMode::Verbose);

    size_t threadCount() const noexcept { return pool_ ? pool_->size() : 1; }

    /**
     * @brief 停止线程池；之后的并行处理会抛出 OperationException
     */
    void shutdown();

private:
    SheetResult processOne(const core::Grid& grid, const detection::DetectionOptions& options,
                           TableMode mode) const;

    SheetProcessor processor_;
    std::unique_ptr<core::ThreadPool> pool_;
};

}} // namespace sheetscan::table
