#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace gridbind {
namespace de {

/**
 * @brief 当前请求针对的是剩余数据行整体还是单独一行
 */
enum class DecodeTarget : uint8_t {
    Grid,
    Row
};

/**
 * @brief 解码游标
 *
 * row 为 0-based 数据行下标（对应网格第 row + 1 行）。
 * column 为空表示解码整行（或整个网格），有值表示解码该行的一个单元格。
 * 行内列只增不减，行只增不减，从不回退。
 */
struct Cursor {
    size_t row = 0;
    std::optional<size_t> column;
    bool parsing_tag_only = false;      // 正在读取枚举标签
    DecodeTarget target = DecodeTarget::Grid;

    bool atFieldLevel() const { return column.has_value(); }
    bool atRowLevel() const { return !column && target == DecodeTarget::Row; }
    bool atGridLevel() const { return !column && target == DecodeTarget::Grid; }

    /**
     * @brief 在网格中的行号（含表头）
     */
    size_t gridRow() const { return row + 1; }
};

}} // namespace gridbind::de
