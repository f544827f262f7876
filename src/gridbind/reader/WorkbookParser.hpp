/**
 * @file WorkbookParser.hpp
 * @brief 工作簿XML解析器（xl/workbook.xml）
 */

#pragma once

#include "BaseSAXParser.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace gridbind {
namespace reader {

/**
 * @brief 工作表信息
 */
struct WorksheetInfo {
    std::string name;
    std::string sheet_id;
    std::string rel_id;
    std::string worksheet_path;   // ZIP 内部路径，如 "xl/worksheets/sheet1.xml"
};

/**
 * @brief 工作簿解析器：工作表列表与日期系统
 *
 * 工作表路径由关系映射解析；映射中没有时回退到
 * "xl/worksheets/sheet{sheetId}.xml"。
 */
class WorkbookParser : public BaseSAXParser {
public:
    WorkbookParser() = default;
    ~WorkbookParser() override = default;

    /**
     * @brief 设置关系映射（Id -> Target，来自 RelationshipsParser）
     */
    void setRelationships(std::unordered_map<std::string, std::string> relationships) {
        relationships_ = std::move(relationships);
    }

    bool parse(const std::string& xml_content) {
        reset();
        return parseXML(xml_content);
    }

    const std::vector<WorksheetInfo>& getWorksheets() const { return worksheets_; }

    /**
     * @brief 工作簿是否使用 1904 日期系统
     */
    bool isDate1904() const { return date1904_; }

    void reset() {
        worksheets_.clear();
        date1904_ = false;
        in_sheets_section_ = false;
    }

    /**
     * @brief 关系 Target 转为 ZIP 内部路径（相对 xl/，或以 / 开头的绝对路径）
     */
    static std::string resolveTarget(const std::string& target);

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    std::vector<WorksheetInfo> worksheets_;
    std::unordered_map<std::string, std::string> relationships_;
    bool date1904_ = false;
    bool in_sheets_section_ = false;
};

}} // namespace gridbind::reader
