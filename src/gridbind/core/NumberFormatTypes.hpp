#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace gridbind {
namespace core {

/**
 * @file NumberFormatTypes.hpp
 * @brief 单元格数字格式类别（格式标签）
 *
 * 与电子表格服务返回的 numberFormat.type 取值一一对应，
 * 解码时只关心 DATE / TIME / DATE_TIME 三类。
 */
enum class NumberFormatKind : uint8_t {
    Unspecified = 0,
    Text = 1,
    Number = 2,
    Percent = 3,
    Currency = 4,
    Date = 5,
    Time = 6,
    DateTime = 7,
    Scientific = 8
};

/**
 * @brief 枚举转标签字符串（如 DateTime -> "DATE_TIME"）
 */
const char* toString(NumberFormatKind kind);

/**
 * @brief 标签字符串转枚举，未知标签返回 Unspecified
 */
NumberFormatKind parseNumberFormatKind(std::string_view tag);

/**
 * @brief 是否为日期/时间类标签（数值按显示文本解码）
 */
bool isTemporal(NumberFormatKind kind);

/**
 * @brief 根据 Excel 格式代码推断类别
 *
 * "General" 返回空；含日期时间占位符（y/m/d/h/s，忽略引号、转义与颜色段）
 * 的代码返回 Date/Time/DateTime；"%" 为 Percent；"E+" 为 Scientific；
 * "@" 为 Text；货币符号为 Currency；其他为 Number。
 */
std::optional<NumberFormatKind> classifyFormatCode(std::string_view format_code);

}} // namespace gridbind::core
