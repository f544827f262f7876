#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 解码引擎 (de)
#define DECODE_TRACE(...)  GRIDBIND_LOG_TRACE("[TRC][deco] " __VA_ARGS__)
#define DECODE_DEBUG(...)  GRIDBIND_LOG_DEBUG("[DBG][deco] " __VA_ARGS__)

// 数据源 (source)
#define SOURCE_DEBUG(...)  GRIDBIND_LOG_DEBUG("[DBG][srce] " __VA_ARGS__)
#define SOURCE_INFO(...)   GRIDBIND_LOG_INFO("[INF][srce] " __VA_ARGS__)
#define SOURCE_WARN(...)   GRIDBIND_LOG_WARN("[WRN][srce] " __VA_ARGS__)
#define SOURCE_ERROR(...)  GRIDBIND_LOG_ERROR("[ERR][srce] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)  GRIDBIND_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   GRIDBIND_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   GRIDBIND_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  GRIDBIND_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     GRIDBIND_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)      GRIDBIND_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     GRIDBIND_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...) GRIDBIND_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)  GRIDBIND_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...) GRIDBIND_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 示例模块 (examples)
#define EXAMPLE_INFO(...)  GRIDBIND_LOG_INFO("[INF][demo] " __VA_ARGS__)
#define EXAMPLE_WARN(...)  GRIDBIND_LOG_WARN("[WRN][demo] " __VA_ARGS__)
#define EXAMPLE_ERROR(...) GRIDBIND_LOG_ERROR("[ERR][demo] " __VA_ARGS__)

// 条件日志宏 (使用模块宏实现)
#if ENABLE_DECODE_TRACE_LOGS
    #define GRIDBIND_LOG_DECODE_TRACE(...) DECODE_TRACE(__VA_ARGS__)
#else
    #define GRIDBIND_LOG_DECODE_TRACE(...) do {} while(0)
#endif

#if ENABLE_ZIP_DEBUG_LOGS
    #define GRIDBIND_LOG_ZIP_DEBUG(...) ARCHIVE_DEBUG(__VA_ARGS__)
#else
    #define GRIDBIND_LOG_ZIP_DEBUG(...) do {} while(0)
#endif
