#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <fmt/format.h>

namespace gridbind {
namespace core {

/**
 * @brief GridBind统一错误码
 *
 * 解码失败的封闭分类：
 * - 底层（引擎、协议、数据源）只返回错误码，不抛异常
 * - 用户层通过 ExceptionBridge 转换为异常
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 网格结构错误 (1-19)
    ZeroRows = 1,

    // 单元格取值错误 (20-39)
    MissingValue = 20,
    NotNumber = 21,
    NotBoolean = 22,

    // 协议错误 (40-59)
    UnsupportedVariant = 40,
    Custom = 41,

    // 上游数据源错误 (60-79)
    UpstreamFailure = 60
};

/**
 * @brief 单元格位置（工作表坐标，0-based）
 */
struct CellPosition {
    uint32_t row = 0;
    uint32_t column = 0;

    /// A1 风格引用，例如 "B3"
    std::string toReference() const;

    bool operator==(const CellPosition& other) const noexcept {
        return row == other.row && column == other.column;
    }
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息
    std::optional<CellPosition> position;  // 仅 MissingValue / NotNumber / NotBoolean 携带

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 创建错误对象的便利函数
 */
inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

/**
 * @brief 创建带单元格位置的错误，context 形如 "at B3 (row 3, column 2)"
 */
Error makeCellError(ErrorCode code, CellPosition position);

/**
 * @brief 协议层自定义错误
 */
inline Error makeCustomError(const std::string& message) {
    return Error(ErrorCode::Custom, message);
}

}} // namespace gridbind::core
