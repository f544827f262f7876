#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace gridbind {

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

    /**
     * @brief 日志配置
     *
     * log_file_path 为空时只输出到控制台。
     * 环境变量 GRIDBIND_LOG_LEVEL（trace/debug/info/warn/error/critical/off）
     * 在 initialize() 时覆盖 level。
     */
    struct Config {
        std::string log_file_path;
        Level level = Level::WARN;
        bool enable_console = true;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t max_files = 5;
        WriteMode write_mode = WriteMode::TRUNCATE;
    };

    static Logger& getInstance();

    void initialize(const Config& config);

    /// 使用默认配置初始化
    void initialize();

    void setLevel(Level level);
    Level getLevel() const;
    bool shouldLog(Level level) const;

    /**
     * @brief 输出一条已格式化的日志
     */
    void log(Level level, const std::string& message);

    template<typename... Args>
    void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!shouldLog(level)) return;
        try {
            log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error& e) {
            log(level, fmt_str + " [format error: " + e.what() + "]");
        }
    }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!shouldLog(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line,
                                                     extractFunctionName(func), fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

    static Level parseLevel(const std::string& name, Level fallback);
    static const char* levelToString(Level level);

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void initializeLocked(const Config& config);
    void logToConsole(Level level, const std::string& message);
    void logToFile(const std::string& message);
    std::string formatMessage(Level level, const std::string& message) const;
    std::string getTimestamp() const;
    void rotateFileIfNeeded();
    std::string getRotatedFilename(size_t index) const;

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
        size_t last_colon = sig.rfind("::");
        if (last_colon != std::string::npos) {
            sig = sig.substr(last_colon + 2);
        }
        size_t paren = sig.find('(');
        if (paren != std::string::npos) {
            sig = sig.substr(0, paren);
        }
        return sig;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::WARN};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
};

using LoggerConfig = Logger::Config;

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define GRIDBIND_FUNC __FUNCTION__
#else
#  define GRIDBIND_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define GRIDBIND_LOG_TRACE(fmt, ...)    gridbind::Logger::getInstance().logCtx(gridbind::Logger::Level::TRACE,    __FILE__, __LINE__, GRIDBIND_FUNC, fmt, ##__VA_ARGS__)
#define GRIDBIND_LOG_DEBUG(fmt, ...)    gridbind::Logger::getInstance().logCtx(gridbind::Logger::Level::DEBUG,    __FILE__, __LINE__, GRIDBIND_FUNC, fmt, ##__VA_ARGS__)
#define GRIDBIND_LOG_INFO(fmt, ...)     gridbind::Logger::getInstance().logCtx(gridbind::Logger::Level::INFO,     __FILE__, __LINE__, GRIDBIND_FUNC, fmt, ##__VA_ARGS__)
#define GRIDBIND_LOG_WARN(fmt, ...)     gridbind::Logger::getInstance().logCtx(gridbind::Logger::Level::WARN,     __FILE__, __LINE__, GRIDBIND_FUNC, fmt, ##__VA_ARGS__)
#define GRIDBIND_LOG_ERROR(fmt, ...)    gridbind::Logger::getInstance().logCtx(gridbind::Logger::Level::ERROR,    __FILE__, __LINE__, GRIDBIND_FUNC, fmt, ##__VA_ARGS__)
#define GRIDBIND_LOG_CRITICAL(fmt, ...) gridbind::Logger::getInstance().logCtx(gridbind::Logger::Level::CRITICAL, __FILE__, __LINE__, GRIDBIND_FUNC, fmt, ##__VA_ARGS__)

} // namespace gridbind
