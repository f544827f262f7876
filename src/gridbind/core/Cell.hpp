#pragma once

#include "gridbind/core/NumberFormatTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gridbind {
namespace core {

/**
 * @brief 单元格错误类型（#DIV/0!、#N/A 等）
 */
enum class CellErrorType : uint8_t {
    Unspecified = 0,
    Error,          // 通用错误
    NullValue,      // #NULL!
    DivideByZero,   // #DIV/0!
    Value,          // #VALUE!
    Ref,            // #REF!
    Name,           // #NAME?
    Num,            // #NUM!
    NotAvailable,   // #N/A
    Loading         // #LOADING...
};

/**
 * @brief 由显示文本（如 "#DIV/0!"）识别错误类型
 */
CellErrorType parseCellErrorType(std::string_view text);

/**
 * @brief 错误标记
 */
struct CellErrorValue {
    CellErrorType type = CellErrorType::Unspecified;
    std::string message;
};

/**
 * @brief 单元格原始值（有效值）
 *
 * 与电子表格服务的 effectiveValue 一致，可以同时设置多个字段。
 * 全部字段为空表示"已填充但无法识别"的形态。
 */
struct CellValue {
    std::optional<bool> bool_value;
    std::optional<double> number_value;
    std::optional<std::string> string_value;
    std::optional<CellErrorValue> error_value;
    std::optional<std::string> formula_value;

    bool isUnrecognized() const {
        return !bool_value && !number_value && !string_value && !error_value && !formula_value;
    }
};

/**
 * @brief 网格中的一个单元格：原始值 + 显示文本 + 格式标签
 *
 * 原始值存在即视为"已填充"。单元格为不可变数据，只通过工厂方法或
 * 构造函数组装。
 */
class Cell {
public:
    // ========== 构造函数 ==========

    /**
     * @brief 缺失单元格（无原始值、无显示文本）
     */
    Cell() = default;

    Cell(std::optional<CellValue> raw_value,
         std::optional<std::string> formatted_value,
         std::optional<std::string> format_kind = std::nullopt)
        : raw_value_(std::move(raw_value))
        , formatted_value_(std::move(formatted_value))
        , format_kind_(std::move(format_kind)) {}

    // ========== 工厂方法 ==========

    static Cell absent() { return Cell(); }

    /**
     * @brief 文本单元格，显示文本与原始文本相同
     */
    static Cell text(std::string value);

    /**
     * @brief 数值单元格；未指定显示文本时使用最短往返表示
     */
    static Cell number(double value,
                       std::optional<std::string> formatted = std::nullopt,
                       std::optional<NumberFormatKind> kind = std::nullopt);

    /**
     * @brief 日期/时间单元格：原始值为序列号，显示文本为格式化结果
     */
    static Cell temporal(double serial, std::string formatted,
                         NumberFormatKind kind = NumberFormatKind::Date);

    /**
     * @brief 布尔单元格，显示文本为 "TRUE"/"FALSE"
     */
    static Cell boolean(bool value);

    /**
     * @brief 错误单元格（#N/A 等）
     */
    static Cell error(std::string formatted, std::string message = "");

    /**
     * @brief 公式单元格（尚无计算结果）
     */
    static Cell formula(std::string formula, std::optional<std::string> formatted = std::nullopt);

    /**
     * @brief 已填充但原始值无法识别的单元格
     */
    static Cell unrecognized(std::optional<std::string> formatted = std::nullopt);

    // ========== 查询 ==========

    bool isPopulated() const { return raw_value_.has_value(); }
    bool isAbsent() const { return !raw_value_.has_value(); }

    const std::optional<CellValue>& getRawValue() const { return raw_value_; }
    const std::optional<std::string>& getFormattedValue() const { return formatted_value_; }
    const std::optional<std::string>& getFormatKindTag() const { return format_kind_; }

    /**
     * @brief 解析后的格式类别，无标签时为 Unspecified
     */
    NumberFormatKind getFormatKind() const;

    bool operator==(const Cell& other) const;
    bool operator!=(const Cell& other) const { return !(*this == other); }

private:
    std::optional<CellValue> raw_value_;
    std::optional<std::string> formatted_value_;
    std::optional<std::string> format_kind_;
};

/**
 * @brief 数值的默认显示文本（整数不带小数点，其余为最短往返表示）
 */
std::string formatNumber(double value);

}} // namespace gridbind::core
