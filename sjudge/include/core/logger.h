/**
 * @file logger.h
 * @brief 轻量级日志系统
 *
 * 特性：
 * - 多日志级别 (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
 * - 控制台（stderr）与文件输出
 * - 时间戳、级别、进程号前缀
 * - 线程安全（排水线程与主线程会同时写日志）
 * - 默认级别可由环境变量 SJUDGE_LOG_LEVEL 指定
 */

#ifndef SJUDGE_CORE_LOGGER_H
#define SJUDGE_CORE_LOGGER_H

#include <string>
#include <fstream>
#include <iostream>
#include <sstream>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <memory>
#include <vector>
#include <optional>
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <unistd.h>

namespace sjudge {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

inline const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

inline const char* level_to_color(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        default: return "";
    }
}

/**
 * @brief 解析日志级别名（不区分大小写）
 * @return 无法识别时返回 std::nullopt
 */
inline std::optional<LogLevel> parse_log_level(std::string name) {
    for (auto &c : name) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info")  return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    if (name == "off")   return LogLevel::OFF;
    return std::nullopt;
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, const std::string &message) = 0;
    virtual void flush() = 0;
};

/**
 * @brief 控制台输出，全部写 stderr
 *
 * stdout 留给评测程序自己的输出（反馈摘要）。
 * 只有 stderr 是终端时才着色，避免把转义序列写进评测机日志文件。
 */
class ConsoleSink : public LogSink {
private:
    bool use_color_;
    std::mutex mutex_;

public:
    explicit ConsoleSink(bool use_color = true)
        : use_color_(use_color && isatty(STDERR_FILENO)) {}

    void write(LogLevel level, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (use_color_) {
            std::cerr << level_to_color(level) << message << "\033[0m\n";
        } else {
            std::cerr << message << '\n';
        }
    }

    void flush() override {
        std::cerr.flush();
    }
};

class FileSink : public LogSink {
private:
    std::ofstream file_;
    std::mutex mutex_;

public:
    explicit FileSink(const std::string &filename) {
        file_.open(filename, std::ios::app);
    }

    bool is_open() const { return file_.is_open(); }

    void write(LogLevel, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        file_ << message << std::endl;
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.flush();
    }
};

/**
 * @brief 日志记录器
 *
 * 行格式: [时间] [级别] [pid] 消息；DEBUG 及以下附带源码位置。
 * 级别是原子量，排水线程读取时不需要加锁。
 */
class Logger {
private:
    std::atomic<LogLevel> level_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::mutex mutex_;

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        localtime_r(&time, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static const char* short_path(const char *path) {
        const char *slash = strrchr(path, '/');
        return slash ? slash + 1 : path;
    }

public:
    Logger() : level_(LogLevel::WARN) {}

    Logger& set_level(LogLevel level) { level_.store(level); return *this; }
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel level) const { return level >= level_.load(); }

    Logger& add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
        return *this;
    }

    /**
     * @brief 追加写入日志文件
     * @return 文件无法打开时返回 false，日志器保持原样
     */
    bool add_file(const std::string &filename) {
        auto sink = std::make_shared<FileSink>(filename);
        if (!sink->is_open()) {
            return false;
        }
        add_sink(sink);
        return true;
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->flush();
        }
    }

    void log(LogLevel level, const char *file, int line, const std::string &message) {
        if (!enabled(level)) return;

        std::ostringstream oss;
        oss << "[" << timestamp() << "] [" << level_to_string(level) << "] [" << getpid() << "] " << message;
        if (level <= LogLevel::DEBUG && file) {
            oss << " (" << short_path(file) << ":" << line << ")";
        }
        std::string formatted = oss.str();

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->write(level, formatted);
        }
    }

    void logf(LogLevel level, const char *file, int line, const char *fmt, ...) {
        if (!enabled(level)) return;

        char buffer[2048];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        log(level, file, line, buffer);
    }
};

/**
 * @brief 全局默认日志器
 *
 * 首次使用时挂上控制台输出，级别取 SJUDGE_LOG_LEVEL（缺省 WARN）。
 */
inline Logger& default_logger() {
    static Logger logger;
    static const bool initialized = [] {
        logger.add_sink(std::make_shared<ConsoleSink>());
        const char *env = getenv("SJUDGE_LOG_LEVEL");
        if (env) {
            if (auto level = parse_log_level(env)) {
                logger.set_level(*level);
            }
        }
        return true;
    }();
    (void)initialized;
    return logger;
}

/**
 * @brief 流式日志构建器，析构时提交
 */
class LogStream {
private:
    Logger &logger_;
    LogLevel level_;
    const char *file_;
    int line_;
    std::ostringstream stream_;

public:
    LogStream(Logger &logger, LogLevel level, const char *file, int line)
        : logger_(logger), level_(level), file_(file), line_(line) {}

    ~LogStream() {
        logger_.log(level_, file_, line_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T &value) {
        if (logger_.enabled(level_)) {
            stream_ << value;
        }
        return *this;
    }
};

} // namespace sjudge

//==============================================================================
// 日志宏
//==============================================================================

#define LOG_DEFAULT() sjudge::default_logger()
#define LOG_SET_LEVEL(level) sjudge::default_logger().set_level(level)

#define LOG_TRACE sjudge::LogStream(sjudge::default_logger(), sjudge::LogLevel::TRACE, __FILE__, __LINE__)
#define LOG_DEBUG sjudge::LogStream(sjudge::default_logger(), sjudge::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOG_INFO  sjudge::LogStream(sjudge::default_logger(), sjudge::LogLevel::INFO,  __FILE__, __LINE__)
#define LOG_WARN  sjudge::LogStream(sjudge::default_logger(), sjudge::LogLevel::WARN,  __FILE__, __LINE__)
#define LOG_ERROR sjudge::LogStream(sjudge::default_logger(), sjudge::LogLevel::ERROR, __FILE__, __LINE__)
#define LOG_FATAL sjudge::LogStream(sjudge::default_logger(), sjudge::LogLevel::FATAL, __FILE__, __LINE__)

#define LOG_DEBUGF(fmt, ...) sjudge::default_logger().logf(sjudge::LogLevel::DEBUG, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_INFOF(fmt, ...)  sjudge::default_logger().logf(sjudge::LogLevel::INFO,  __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARNF(fmt, ...)  sjudge::default_logger().logf(sjudge::LogLevel::WARN,  __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERRORF(fmt, ...) sjudge::default_logger().logf(sjudge::LogLevel::ERROR, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#endif // SJUDGE_CORE_LOGGER_H
