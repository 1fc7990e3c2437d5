#include "sheetscan/SheetScan.hpp"

#include <iostream>

namespace sheetscan {

bool initialize(const std::string& log_file_path, Logger::Level level, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, level, enable_console);
        SHEETSCAN_LOG_INFO("SheetScan library initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统初始化失败，直接输出到标准错误
        std::cerr << "Failed to initialize SheetScan: " << e.what() << std::endl;
        return false;
    }
}

void cleanup() {
    SHEETSCAN_LOG_DEBUG("SheetScan library cleanup");
    Logger::getInstance().shutdown();
}

std::vector<table::Table> processSheet(const core::Grid& grid,
                                       const detection::DetectionOptions& options,
                                       table::TableMode mode) {
    table::SheetProcessor processor;
    return processor.process(grid, options, mode);
}

} // namespace sheetscan
