/**
 * @file ColumnReferenceUtils.hpp
 * @brief 单元格引用与列字母转换工具
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace gridbind {
namespace utils {

/**
 * @brief A1 风格引用解析与生成
 *
 * 所有行列号均为 0-based（A1 -> (0, 0)）。最多支持 3 个字母的列（A-XFD）。
 */
class ColumnReferenceUtils {
public:
    static constexpr uint32_t MAX_COLUMNS = 16384;  // Excel 上限 XFD

    /**
     * @brief 解析引用中的列部分
     * @param cell_ref 单元格引用（如 "C23"）或纯列（如 "AA"）
     * @return 列号（0-based），无字母部分或超出范围时返回空
     */
    static std::optional<uint32_t> parseColumn(std::string_view cell_ref);

    /**
     * @brief 解析完整单元格引用，允许 "$A$1" 形式
     * @return (row, column)，均为 0-based
     */
    static std::optional<std::pair<uint32_t, uint32_t>> parseReference(std::string_view reference);

    /**
     * @brief 列号转字母（0 -> "A", 26 -> "AA"）
     */
    static std::string columnToLetters(uint32_t column);

    /**
     * @brief 生成单元格引用（如 (2, 1) -> "B3"）
     */
    static std::string cellReference(uint32_t row, uint32_t column) {
        return columnToLetters(column) + std::to_string(static_cast<uint64_t>(row) + 1);
    }
};

}} // namespace gridbind::utils
