#pragma once

// GridBind - 将电子表格网格解码为强类型结构
// 第 0 行为表头，其余行为数据行

#include <string>

// === 公共接口 ===
#include "gridbind/core/Cell.hpp"
#include "gridbind/core/Grid.hpp"
#include "gridbind/core/ErrorCode.hpp"
#include "gridbind/core/Expected.hpp"
#include "gridbind/core/Exception.hpp"
#include "gridbind/core/ExceptionBridge.hpp"
#include "gridbind/serde/Deserialize.hpp"
#include "gridbind/serde/Value.hpp"
#include "gridbind/de/FromGrid.hpp"
#include "gridbind/source/GridSource.hpp"
#include "gridbind/source/InMemoryGridSource.hpp"
#include "gridbind/source/XlsxGridSource.hpp"
#include "gridbind/utils/Logger.hpp"

// 版本信息
#define GRIDBIND_VERSION_MAJOR 1
#define GRIDBIND_VERSION_MINOR 0
#define GRIDBIND_VERSION_PATCH 0
#define GRIDBIND_VERSION_STRING "1.0.0"

// 导出宏定义
#ifdef _WIN32
    #ifdef GRIDBIND_SHARED
        #ifdef GRIDBIND_EXPORTS
            #define GRIDBIND_API __declspec(dllexport)
        #else
            #define GRIDBIND_API __declspec(dllimport)
        #endif
    #else
        #define GRIDBIND_API
    #endif
#else
    #define GRIDBIND_API
#endif

namespace gridbind {

inline std::string getVersion() {
    return GRIDBIND_VERSION_STRING;
}

/**
 * @brief 初始化GridBind库（日志系统）
 * @param config 日志配置，环境变量 GRIDBIND_LOG_LEVEL 可覆盖级别
 * @return 初始化是否成功
 */
GRIDBIND_API bool initialize(const LoggerConfig& config = LoggerConfig());

/**
 * @brief 刷新并关闭日志
 */
GRIDBIND_API void cleanup();

} // namespace gridbind
