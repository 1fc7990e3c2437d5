#pragma once

#include <atomic>
#include <cstring>
#include <fstream>
#include <mutex>
#include <string>
#include <algorithm>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace sheetscan {

/**
 * @brief 进程级日志器
 *
 * 控制台输出走 stderr（stdout 留给 CLI 的表格摘要），
 * 文件输出可选，超过 max_file_size 后按 .1 .2 ... 轮转。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    /**
     * @brief 初始化日志器，重复调用无效
     * @param log_file_path 日志文件路径，空字符串表示只输出到控制台
     */
    void initialize(const std::string& log_file_path = "",
                    Level level = Level::WARN,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    void setConsoleEnabled(bool enabled) { enable_console_.store(enabled); }

    /**
     * @brief 解析级别名称（trace/debug/info/warn/error/critical/off，不区分大小写）
     * @return 解析失败返回 false，level 保持不变
     */
    static bool parseLevel(const std::string& name, Level& level);

    void log(Level level, const std::string& message);

    template<typename... Args>
    inline void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        if constexpr (sizeof...(Args) == 0) {
            log(level, fmt_str);
        } else {
            try {
                log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
            } catch (const fmt::format_error& e) {
                log(level, fmt::format("{} <format error: {}>", fmt_str, e.what()));
            }
        }
    }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx =
            fmt::format("[{}:{}:{}] {}", baseFilename(file), line, extractFunctionName(func), fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    // 提取函数名（去除命名空间和参数）
    static inline std::string extractFunctionName(const char* func_sig) {
        if (!func_sig) return "";
        std::string sig(func_sig);
        size_t paren = sig.find('(');
        if (paren != std::string::npos) {
            sig = sig.substr(0, paren);
        }
        size_t lastColon = sig.rfind("::");
        if (lastColon != std::string::npos) {
            sig = sig.substr(lastColon + 2);
        }
        return sig;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::WARN};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

} // namespace sheetscan

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define SHEETSCAN_FUNC __FUNCTION__
#else
#  define SHEETSCAN_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define SHEETSCAN_LOG_TRACE(fmt, ...)    ::sheetscan::Logger::getInstance().logCtx(::sheetscan::Logger::Level::TRACE,    __FILE__, __LINE__, SHEETSCAN_FUNC, fmt, ##__VA_ARGS__)
#define SHEETSCAN_LOG_DEBUG(fmt, ...)    ::sheetscan::Logger::getInstance().logCtx(::sheetscan::Logger::Level::DEBUG,    __FILE__, __LINE__, SHEETSCAN_FUNC, fmt, ##__VA_ARGS__)
#define SHEETSCAN_LOG_INFO(fmt, ...)     ::sheetscan::Logger::getInstance().logCtx(::sheetscan::Logger::Level::INFO,     __FILE__, __LINE__, SHEETSCAN_FUNC, fmt, ##__VA_ARGS__)
#define SHEETSCAN_LOG_WARN(fmt, ...)     ::sheetscan::Logger::getInstance().logCtx(::sheetscan::Logger::Level::WARN,     __FILE__, __LINE__, SHEETSCAN_FUNC, fmt, ##__VA_ARGS__)
#define SHEETSCAN_LOG_ERROR(fmt, ...)    ::sheetscan::Logger::getInstance().logCtx(::sheetscan::Logger::Level::ERROR,    __FILE__, __LINE__, SHEETSCAN_FUNC, fmt, ##__VA_ARGS__)
#define SHEETSCAN_LOG_CRITICAL(fmt, ...) ::sheetscan::Logger::getInstance().logCtx(::sheetscan::Logger::Level::CRITICAL, __FILE__, __LINE__, SHEETSCAN_FUNC, fmt, ##__VA_ARGS__)
