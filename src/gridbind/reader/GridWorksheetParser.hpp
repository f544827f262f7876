/**
 * @file GridWorksheetParser.hpp
 * @brief 工作表XML流式解析器，输出 core::Grid
 */

#pragma once

#include "BaseSAXParser.hpp"
#include "gridbind/core/Cell.hpp"
#include "gridbind/core/Grid.hpp"
#include "gridbind/core/NumberFormatTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gridbind {
namespace reader {

class SharedStringsParser;
class StylesParser;

/**
 * @brief 工作表解析器：<sheetData> 中的单元格按坐标写入网格
 *
 * 单元格映射：
 * - t="s" 共享字符串、t="inlineStr" 内联字符串、t="str" 公式字符串结果 -> 文本
 * - t="b" -> 布尔（显示 TRUE/FALSE）
 * - t="e" -> 错误标记，显示文本为错误文本
 * - 其他 -> 数值，格式类别由样式的数字格式推断，显示文本按类别渲染
 * - 只有公式没有缓存值 -> 公式标记，显示文本为 "=公式"
 * - 没有值 -> 缺失
 *
 * 行、列之间的空隙填充为缺失单元格，网格在最后一个非空行结束。
 */
class GridWorksheetParser : public BaseSAXParser {
public:
    GridWorksheetParser() = default;
    ~GridWorksheetParser() override = default;

    /**
     * @param shared_strings 共享字符串表，可为空
     * @param styles 样式表，可为空（全部按 General 处理）
     * @param date1904 工作簿日期系统
     * @param max_rows 只保留前 max_rows 个网格行（含表头），为空表示不限制
     */
    void configure(const SharedStringsParser* shared_strings,
                   const StylesParser* styles,
                   bool date1904,
                   std::optional<size_t> max_rows = std::nullopt);

    bool parse(const std::string& xml_content) {
        reset();
        return parseXML(xml_content);
    }

    /**
     * @brief 取出解析结果（尾部空行已去除）
     */
    core::Grid takeGrid();

    size_t getCellsProcessed() const { return cells_processed_; }

    void reset();

    /**
     * @brief 数值的显示文本
     *
     * 日期 "YYYY-MM-DD"，时间 "HH:MM:SS"，日期时间 "YYYY-MM-DD HH:MM:SS"，
     * 百分比乘以 100 后加 "%"，其他为最短往返表示。
     */
    static std::string renderNumber(double value, std::optional<core::NumberFormatKind> kind, bool date1904);

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    const SharedStringsParser* shared_strings_ = nullptr;
    const StylesParser* styles_ = nullptr;
    bool date1904_ = false;
    std::optional<size_t> max_rows_;

    std::vector<core::Row> rows_;
    size_t cells_processed_ = 0;

    // 解析状态
    bool in_sheet_data_ = false;
    bool in_row_ = false;
    bool in_cell_ = false;
    bool in_inline_string_ = false;
    bool in_phonetic_ = false;
    uint32_t current_row_ = 0;      // 0-based
    uint32_t next_row_ = 0;
    uint32_t current_col_ = 0;      // 0-based
    uint32_t next_col_ = 0;

    // 当前单元格
    std::string cell_type_;
    size_t cell_style_ = 0;
    std::optional<std::string> cell_value_;
    std::optional<std::string> cell_formula_;
    std::string inline_text_;

    void beginCell(const std::vector<xml::XMLAttribute>& attributes);
    void finishCell();
    std::optional<core::Cell> buildCell();
    void storeCell(core::Cell cell);
};

}} // namespace gridbind::reader
