#pragma once

#include "gridbind/core/Grid.hpp"
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace gridbind {
namespace de {

/**
 * @brief 表头索引：列位置 → 可选字段名
 *
 * 由第 0 行一次性构建。表头单元格没有显示文本的列保留为"无字段"标记，
 * 以保证后续列位置稳定；映射解码时跳过这些列，位置解码时仍然计数。
 * 字段名是指向网格内字符串的视图，索引不能比网格活得更久。
 */
class HeaderIndex {
public:
    HeaderIndex() = default;

    /**
     * @brief 从表头行构建索引，单次遍历，没有失败情形
     */
    static HeaderIndex fromRow(const core::Row& header);

    size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }

    bool hasField(size_t column) const {
        return column < names_.size() && names_[column].has_value();
    }

    /**
     * @brief 列的字段名；越界或无字段时返回 std::nullopt
     */
    std::optional<std::string_view> fieldName(size_t column) const;

    /**
     * @brief 在 [from, limit) 中查找下一个有字段名的列
     */
    std::optional<size_t> nextFieldColumn(size_t from, size_t limit) const;

    /**
     * @brief 按字段名查找列（第一个匹配）
     */
    std::optional<size_t> columnOf(std::string_view name) const;

    /**
     * @brief 有字段名的列数
     */
    size_t fieldCount() const;

private:
    std::vector<std::optional<std::string_view>> names_;
};

}} // namespace gridbind::de
