#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用

#ifndef ENABLE_DECODE_TRACE_LOGS
#define ENABLE_DECODE_TRACE_LOGS 0   // 逐单元格的解码跟踪日志（量大）
#endif

#ifndef ENABLE_ZIP_DEBUG_LOGS
#define ENABLE_ZIP_DEBUG_LOGS 0      // ZIP条目级调试日志
#endif

// 条件日志宏在 ModuleLoggers.hpp 中基于模块宏定义：
// GRIDBIND_LOG_DECODE_TRACE -> DECODE_TRACE
// GRIDBIND_LOG_ZIP_DEBUG    -> ARCHIVE_DEBUG
