#include "Logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <thread>
#include <fmt/chrono.h>

namespace gridbind {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const Config& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_.load()) {
        return;
    }
    shutting_down_.store(false);
    initializeLocked(config);
}

void Logger::initialize() {
    initialize(Config{});
}

void Logger::initializeLocked(const Config& config) {
    config_ = config;

    Level level = config.level;
    if (const char* env_level = std::getenv("GRIDBIND_LOG_LEVEL")) {
        level = parseLevel(env_level, level);
    }
    current_level_.store(level);
    enable_console_.store(config.enable_console);

    if (!config_.log_file_path.empty()) {
        std::error_code ec;
        std::filesystem::path log_path(config_.log_file_path);
        std::filesystem::path log_dir = log_path.parent_path();
        if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
            std::filesystem::create_directories(log_dir, ec);
        }
        if (ec) {
            std::cerr << "Logger: cannot create log directory " << log_dir.string()
                      << ": " << ec.message() << std::endl;
        }

        std::ios::openmode open_mode = (config_.write_mode == WriteMode::APPEND)
                                       ? (std::ios::out | std::ios::app)
                                       : (std::ios::out | std::ios::trunc);
        file_stream_.open(config_.log_file_path, open_mode);
        if (!file_stream_.is_open()) {
            std::cerr << "Logger: cannot open log file " << config_.log_file_path << std::endl;
        }
        if (file_stream_.is_open() && config_.write_mode == WriteMode::APPEND) {
            file_stream_.seekp(0, std::ios::end);
            current_file_size_ = static_cast<size_t>(file_stream_.tellp());
        } else {
            current_file_size_ = 0;
        }
    }

    initialized_.store(true);

    if (shouldLog(Level::INFO)) {
        std::string msg = formatMessage(Level::INFO,
            fmt::format("Logger initialized. Log file: {}, Level: {}",
                        config_.log_file_path.empty() ? "<none>" : config_.log_file_path,
                        levelToString(level)));
        if (enable_console_.load()) {
            logToConsole(Level::INFO, msg);
        }
        logToFile(msg);
    }
}

void Logger::setLevel(Level level) {
    current_level_.store(level);
}

Logger::Level Logger::getLevel() const {
    return current_level_.load();
}

bool Logger::shouldLog(Level level) const {
    return level != Level::OFF &&
           static_cast<int>(level) >= static_cast<int>(current_level_.load()) &&
           !shutting_down_.load();
}

void Logger::log(Level level, const std::string& message) {
    if (!shouldLog(level)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) return;
    if (!initialized_.load()) {
        initializeLocked(config_);
    }

    std::string formatted_message = formatMessage(level, message);

    if (enable_console_.load()) {
        logToConsole(level, formatted_message);
    }
    logToFile(formatted_message);

    // 警告及以上立即刷新
    if (level >= Level::WARN && file_stream_.is_open()) {
        file_stream_.flush();
    }
}

void Logger::logToConsole(Level level, const std::string& message) {
    const char* color_code;
    switch (level) {
        case Level::TRACE:    color_code = "\033[37m"; break; // 白色
        case Level::DEBUG:    color_code = "\033[36m"; break; // 青色
        case Level::INFO:     color_code = "\033[32m"; break; // 绿色
        case Level::WARN:     color_code = "\033[33m"; break; // 黄色
        case Level::ERROR:    color_code = "\033[31m"; break; // 红色
        case Level::CRITICAL: color_code = "\033[35m"; break; // 紫色
        default:              color_code = "\033[0m";  break;
    }

    // 日志走 stderr，避免污染程序的标准输出
    std::cerr << color_code << message << "\033[0m" << '\n';
}

void Logger::logToFile(const std::string& message) {
    if (!file_stream_.is_open()) {
        return;
    }

    rotateFileIfNeeded();

    file_stream_ << message << '\n';
    current_file_size_ += message.length() + 1;
}

void Logger::rotateFileIfNeeded() {
    if (current_file_size_ < config_.max_file_size || config_.max_files == 0) {
        return;
    }

    file_stream_.close();

    std::error_code ec;
    for (size_t i = config_.max_files - 1; i > 0; --i) {
        std::string old_file = getRotatedFilename(i - 1);
        std::string new_file = getRotatedFilename(i);
        if (std::filesystem::exists(old_file, ec)) {
            std::filesystem::rename(old_file, new_file, ec);
        }
    }

    file_stream_.open(config_.log_file_path, std::ios::out | std::ios::trunc);
    current_file_size_ = 0;
}

std::string Logger::getRotatedFilename(size_t index) const {
    if (index == 0) {
        return config_.log_file_path;
    }
    return fmt::format("{}.{}", config_.log_file_path, index);
}

std::string Logger::formatMessage(Level level, const std::string& message) const {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return fmt::format("[{}] [{:<5}] [{}] {}",
                       getTimestamp(),
                       levelToString(level),
                       oss.str(),
                       message);
}

const char* Logger::levelToString(Level level) {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO";
        case Level::WARN:     return "WARN";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRIT";
        case Level::OFF:      return "OFF";
        default:              return "UNKN";
    }
}

Logger::Level Logger::parseLevel(const std::string& name, Level fallback) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return Level::TRACE;
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    if (lower == "critical") return Level::CRITICAL;
    if (lower == "off") return Level::OFF;
    return fallback;
}

std::string Logger::getTimestamp() const {
    auto now = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", now);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    std::cerr.flush();
}

void Logger::shutdown() {
    shutting_down_.store(true);

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
    initialized_.store(false);
}

Logger::~Logger() {
    shutdown();
}

} // namespace gridbind
