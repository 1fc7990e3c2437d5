#pragma once
#include "sheetscan/utils/Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 格式: [等级][模块] 消息
 */

// 输入归一化模块 (input)
#define INPUT_TRACE(...)    SHEETSCAN_LOG_TRACE("[TRC][inpt] " __VA_ARGS__)
#define INPUT_DEBUG(...)    SHEETSCAN_LOG_DEBUG("[DBG][inpt] " __VA_ARGS__)
#define INPUT_INFO(...)     SHEETSCAN_LOG_INFO("[INF][inpt] " __VA_ARGS__)
#define INPUT_WARN(...)     SHEETSCAN_LOG_WARN("[WRN][inpt] " __VA_ARGS__)
#define INPUT_ERROR(...)    SHEETSCAN_LOG_ERROR("[ERR][inpt] " __VA_ARGS__)

// 区域检测模块 (detection)
#define DETECT_TRACE(...)    SHEETSCAN_LOG_TRACE("[TRC][dtct] " __VA_ARGS__)
#define DETECT_DEBUG(...)    SHEETSCAN_LOG_DEBUG("[DBG][dtct] " __VA_ARGS__)
#define DETECT_INFO(...)     SHEETSCAN_LOG_INFO("[INF][dtct] " __VA_ARGS__)
#define DETECT_WARN(...)     SHEETSCAN_LOG_WARN("[WRN][dtct] " __VA_ARGS__)
#define DETECT_ERROR(...)    SHEETSCAN_LOG_ERROR("[ERR][dtct] " __VA_ARGS__)

// 表头解析模块 (headers)
#define HEADER_DEBUG(...)    SHEETSCAN_LOG_DEBUG("[DBG][hdr ] " __VA_ARGS__)
#define HEADER_INFO(...)     SHEETSCAN_LOG_INFO("[INF][hdr ] " __VA_ARGS__)
#define HEADER_WARN(...)     SHEETSCAN_LOG_WARN("[WRN][hdr ] " __VA_ARGS__)

// 表组装模块 (table)
#define TABLE_DEBUG(...)    SHEETSCAN_LOG_DEBUG("[DBG][tabl] " __VA_ARGS__)
#define TABLE_INFO(...)     SHEETSCAN_LOG_INFO("[INF][tabl] " __VA_ARGS__)
#define TABLE_WARN(...)     SHEETSCAN_LOG_WARN("[WRN][tabl] " __VA_ARGS__)
#define TABLE_ERROR(...)    SHEETSCAN_LOG_ERROR("[ERR][tabl] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)    SHEETSCAN_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_INFO(...)     SHEETSCAN_LOG_INFO("[INF][util] " __VA_ARGS__)
#define UTILS_WARN(...)     SHEETSCAN_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)    SHEETSCAN_LOG_ERROR("[ERR][util] " __VA_ARGS__)

// 命令行 (cli)
#define CLI_DEBUG(...)    SHEETSCAN_LOG_DEBUG("[DBG][cli ] " __VA_ARGS__)
#define CLI_INFO(...)     SHEETSCAN_LOG_INFO("[INF][cli ] " __VA_ARGS__)
#define CLI_WARN(...)     SHEETSCAN_LOG_WARN("[WRN][cli ] " __VA_ARGS__)
#define CLI_ERROR(...)    SHEETSCAN_LOG_ERROR("[ERR][cli ] " __VA_ARGS__)
