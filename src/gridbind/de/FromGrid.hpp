/**
 * @file FromGrid.hpp
 * @brief 解码入口：网格、电子表格、数据源
 */

#pragma once

#include "gridbind/core/ExceptionBridge.hpp"
#include "gridbind/core/Grid.hpp"
#include "gridbind/de/GridDeserializer.hpp"
#include "gridbind/de/HeaderIndex.hpp"
#include "gridbind/serde/Deserialize.hpp"
#include "gridbind/source/GridSource.hpp"
#include "gridbind/utils/ModuleLoggers.hpp"

namespace gridbind {
namespace de {

/**
 * @brief 将网格解码为 T
 *
 * 第 0 行为表头，其余行为数据行。顶层请求处于网格级：
 * 结构体/映射读取第一个数据行，序列读取全部数据行。
 *
 * @return 解码结果；网格没有任何行时返回 ZeroRows
 */
template<typename T>
core::Result<T> fromGrid(const core::Grid& grid) {
    if (grid.empty()) {
        return core::makeError(core::ErrorCode::ZeroRows, core::toString(core::ErrorCode::ZeroRows),
                               "grid has no header row");
    }

    const HeaderIndex header = HeaderIndex::fromRow(grid.row(0));
    DECODE_DEBUG("Decoding grid: {} data rows, {} named columns",
                 grid.dataRowCount(), header.fieldCount());

    GridDeserializer deserializer(grid, header);
    auto result = serde::deserialize<T>(deserializer);
    if (result.hasError()) {
        DECODE_DEBUG("Decode failed: {}", result.error().fullMessage());
    } else {
        DECODE_DEBUG("Decode finished at data row {}", deserializer.cursor().row);
    }
    return result;
}

/**
 * @brief 解码第一个工作表的第一个网格
 *
 * 没有工作表或工作表没有网格数据时返回 UpstreamFailure。
 */
template<typename T>
core::Result<T> fromSpreadsheet(const core::Spreadsheet& spreadsheet) {
    if (spreadsheet.sheets.empty()) {
        return core::makeError(core::ErrorCode::UpstreamFailure, "spreadsheet has no sheets",
                               spreadsheet.title);
    }
    const auto& sheet = spreadsheet.sheets.front();
    if (sheet.data.empty()) {
        return core::makeError(core::ErrorCode::UpstreamFailure, "sheet has no grid data",
                               sheet.title);
    }
    return fromGrid<T>(sheet.data.front());
}

/**
 * @brief 从数据源取得网格并解码
 *
 * 取数失败时包装为 UpstreamFailure，上下文为数据源描述。
 */
template<typename T>
core::Result<T> fromSource(source::GridSource& source) {
    auto grid = source.fetch();
    if (grid.hasError()) {
        SOURCE_WARN("Failed to fetch grid from {}: {}", source.describe(), grid.error().fullMessage());
        if (grid.error().code == core::ErrorCode::UpstreamFailure) {
            return std::move(grid).error();
        }
        return core::makeError(core::ErrorCode::UpstreamFailure, grid.error().fullMessage(),
                               source.describe());
    }
    return fromGrid<T>(grid.value());
}

// ========== 异常风格接口 ==========

template<typename T>
T fromGridOrThrow(const core::Grid& grid) {
    return GRIDBIND_UNWRAP(fromGrid<T>(grid));
}

template<typename T>
T fromSpreadsheetOrThrow(const core::Spreadsheet& spreadsheet) {
    return GRIDBIND_UNWRAP(fromSpreadsheet<T>(spreadsheet));
}

template<typename T>
T fromSourceOrThrow(source::GridSource& source) {
    return GRIDBIND_UNWRAP(fromSource<T>(source));
}

}} // namespace gridbind::de
