#pragma once

// SheetScan库 - 电子表格表格结构推断

#include <string>
#include <vector>

#include "sheetscan/core/CellValue.hpp"
#include "sheetscan/core/ErrorCode.hpp"
#include "sheetscan/core/Exception.hpp"
#include "sheetscan/core/Grid.hpp"
#include "sheetscan/detection/DetectionOptions.hpp"
#include "sheetscan/detection/TableDetector.hpp"
#include "sheetscan/input/CsvGridReader.hpp"
#include "sheetscan/input/GridNormalizer.hpp"
#include "sheetscan/table/SheetProcessor.hpp"
#include "sheetscan/table/Table.hpp"
#include "sheetscan/table/WorkbookProcessor.hpp"
#include "sheetscan/utils/Logger.hpp"

// 版本信息
#define SHEETSCAN_VERSION_MAJOR 1
#define SHEETSCAN_VERSION_MINOR 0
#define SHEETSCAN_VERSION_PATCH 0
#define SHEETSCAN_VERSION_STRING "1.0.0"

namespace sheetscan {

inline std::string getVersion() {
    return SHEETSCAN_VERSION_STRING;
}

/**
 * @brief 初始化SheetScan库（日志系统）
 * @param log_file_path 日志文件路径，空字符串表示只输出到控制台
 * @param level 日志级别
 * @param enable_console 是否启用控制台日志
 * @return 初始化是否成功
 */
bool initialize(const std::string& log_file_path = "",
                Logger::Level level = Logger::Level::WARN,
                bool enable_console = true);

/**
 * @brief 清理SheetScan库资源（刷新并关闭日志）
 */
void cleanup();

/**
 * @brief 处理单张工作表的便捷入口
 */
std::vector<table::Table> processSheet(const core::Grid& grid,
                                       const detection::DetectionOptions& options = {},
                                       table::TableMode mode = table::TableMode::Verbose);

} // namespace sheetscan
