#pragma once
#include <source_location>

#include "Logger.h"

// 级别被过滤时不对参数求值（日志参数中常有 ToString() 等拼装）
#define INVENTORY_LOG(level, fmt, ...)                                                                          \
    do {                                                                                                        \
        if (::Logger::instance().isEnabled(level))                                                              \
            ::Logger::instance().write(level, std::source_location::current(), fmt, ##__VA_ARGS__);           \
    } while (0)

#define LOG_TRACE(fmt, ...) INVENTORY_LOG(LogLevel::TRACE, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) INVENTORY_LOG(LogLevel::DEBUG, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) INVENTORY_LOG(LogLevel::INFO, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) INVENTORY_LOG(LogLevel::WARN, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) INVENTORY_LOG(LogLevel::ERROR, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) INVENTORY_LOG(LogLevel::FATAL, fmt, ##__VA_ARGS__)
