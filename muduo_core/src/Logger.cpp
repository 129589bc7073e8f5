#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>

#include "AsyncFileSink.h"
#include "CurrentThread.h"

namespace {
std::string_view BasenameView(std::string_view path) {
    const size_t pos = path.find_last_of("/\\");
    return (pos == std::string_view::npos) ? path : path.substr(pos + 1);
}

// "ret ns::Class::func(args) [with T = ...]" -> "func"
std::string_view UnqualifiedFunction(std::string_view fn) {
    if (const size_t paren = fn.find('('); paren != std::string_view::npos)
        fn = fn.substr(0, paren);
    if (const size_t scope = fn.rfind("::"); scope != std::string_view::npos)
        fn = fn.substr(scope + 2);
    if (const size_t space = fn.rfind(' '); space != std::string_view::npos)
        fn = fn.substr(space + 1);
    if (const size_t angle = fn.find('<'); angle != std::string_view::npos)
        fn = fn.substr(0, angle);
    return fn;
}

// 2024-01-01 12:00:00.123（本地时间）
std::string FormatNow() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::format("{}.{:03d}", buf, static_cast<int>(ms));
}
}  // namespace

LogLevel LogLevelFromString(std::string_view level) {
    std::string upper(level);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "TRACE")
        return LogLevel::TRACE;
    if (upper == "DEBUG")
        return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::WARN;
    if (upper == "ERROR")
        return LogLevel::ERROR;
    if (upper == "FATAL")
        return LogLevel::FATAL;
    return LogLevel::INFO;
}

// ========== 单例与生命周期 ==========

Logger& Logger::instance() {
    static Logger globalLogger;
    return globalLogger;
}

Logger::Logger() = default;

Logger::~Logger() {
    shutdown();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (asyncSink_) {
        asyncSink_->stop();  // 排空队列并落盘
        asyncSink_.reset();
    }
    if (fileOutput_) {
        fileOutput_->close();
        fileOutput_.reset();
    }
}

// ========== 配置 ==========

void Logger::setLogLevel(LogLevel level) {
    logLevel_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::getLogLevel() const {
    return logLevel_.load(std::memory_order_relaxed);
}

void Logger::setOutputToConsole(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleOutput_ = enable;
}

void Logger::setOutputToFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (asyncSink_) {
        asyncSink_->stop();
        asyncSink_.reset();
    }

    fileOutput_ = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!fileOutput_->good()) {
        fileOutput_.reset();
        consoleOutput_ = true;  // 文件不可用时至少保留控制台
        std::cerr << "Logger: failed to open " << filename << ", falling back to console\n";
    }
}

void Logger::setOutputToFileAsync(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    fileOutput_.reset();
    if (asyncSink_) {
        asyncSink_->stop();
        asyncSink_.reset();
    }

    try {
        asyncSink_ = std::make_unique<AsyncFileSink>(filename);
    } catch (const std::exception& e) {
        consoleOutput_ = true;
        std::cerr << "Logger: failed to open async file " << filename << " (" << e.what() << "), falling back to console\n";
    }
}

// ========== 输出 ==========

std::string Logger::locationTag(const std::source_location& loc) {
    return std::format("[{}:{}:{}]", BasenameView(loc.file_name()), UnqualifiedFunction(loc.function_name()), loc.line());
}

void Logger::log(LogLevel level, std::string_view msg) {
    std::string line = std::format("{} [tid:{}] [{}] {}\n", FormatNow(), CurrentThread::tid(), levelToString(level), msg);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (consoleOutput_)
            std::cout << line;
        if (asyncSink_) {
            asyncSink_->submit(std::move(line));
        } else if (fileOutput_) {
            *fileOutput_ << line;
            fileOutput_->flush();
        }
    }

    if (level == LogLevel::FATAL) {
        shutdown();
        std::abort();
    }
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}
