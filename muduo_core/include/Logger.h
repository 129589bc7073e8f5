#pragma once

#include <atomic>
#include <format>
#include <fstream>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>

#include "NonCopyable.h"

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// 大小写不敏感；无法识别时返回 INFO
LogLevel LogLevelFromString(std::string_view level);

class AsyncFileSink;

// 进程级日志器。行格式：时间 [tid:N] [LEVEL] [文件:函数:行] 消息
// 控制台与文件可同时开启；文件输出二选一（同步 ofstream 或 AsyncFileSink）。
class Logger : NonCopyable {
public:
    static Logger& instance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    bool isEnabled(LogLevel level) const noexcept { return level >= logLevel_.load(std::memory_order_relaxed); }

    void setOutputToConsole(bool enable);
    void setOutputToFile(const std::string& filename);
    void setOutputToFileAsync(const std::string& filename);

    // 进程退出前调用：刷盘并停止异步写线程
    void shutdown();

    // 由 LOG_* 宏调用，级别过滤已在宏里完成
    template <typename... Args>
    void write(LogLevel level, const std::source_location& loc, std::format_string<Args...> fmt, Args&&... args) {
        log(level, locationTag(loc) + ' ' + std::format(fmt, std::forward<Args>(args)...));
    }

private:
    Logger();
    ~Logger();

    void log(LogLevel level, std::string_view msg);

    static const char* levelToString(LogLevel level);
    // [短文件名:函数名:行]
    static std::string locationTag(const std::source_location& loc);

    std::atomic<LogLevel> logLevel_{LogLevel::INFO};
    std::mutex mutex_;
    bool consoleOutput_ = true;
    std::unique_ptr<std::ofstream> fileOutput_;
    std::unique_ptr<AsyncFileSink> asyncSink_;
};
