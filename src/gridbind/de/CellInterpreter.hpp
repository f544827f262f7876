#pragma once

#include "gridbind/core/Cell.hpp"
#include <cstdint>
#include <string_view>

namespace gridbind {
namespace de {

/**
 * @brief 单元格解析出的标量类别
 */
enum class ScalarKind : uint8_t {
    Missing,   // 缺失或无法识别
    Boolean,
    Number,
    Text
};

const char* toString(ScalarKind kind) noexcept;

/**
 * @brief 解析结果，text 为指向单元格内字符串的视图
 */
struct InterpretedScalar {
    ScalarKind kind = ScalarKind::Missing;
    bool boolean = false;
    double number = 0.0;
    std::string_view text;

    bool isMissing() const { return kind == ScalarKind::Missing; }
};

/**
 * @brief 单元格解释器：按固定优先级把原始值归为一种标量
 *
 * 优先级：缺失 → 布尔 → 错误标记（显示文本）→ 公式标记（显示文本）
 * → 数值（DATE/TIME/DATE_TIME 格式取显示文本）→ 文本 → 其他视为缺失。
 */
class CellInterpreter {
public:
    static InterpretedScalar interpret(const core::Cell& cell);

    // 结果中的 text 借用单元格内存，不接受临时单元格
    static InterpretedScalar interpret(core::Cell&&) = delete;

    /**
     * @brief 格式标签是否为日期/时间类
     */
    static bool isTemporalTag(std::string_view tag);

private:
    static InterpretedScalar displayText(const core::Cell& cell);
};

}} // namespace gridbind::de
