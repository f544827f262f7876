/**
 * @file WorkbookParser.cpp
 * @brief 工作簿XML解析器实现
 */

#include "gridbind/reader/WorkbookParser.hpp"

namespace gridbind {
namespace reader {

void WorkbookParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name == "workbookPr") {
        date1904_ = getBoolAttributeOr(attributes, "date1904", false);
    } else if (name == "sheets") {
        in_sheets_section_ = true;
    } else if (name == "sheet" && in_sheets_section_) {
        WorksheetInfo info;
        info.name = getAttributeOr(attributes, "name", "");
        info.sheet_id = getAttributeOr(attributes, "sheetId", "");
        info.rel_id = getAttributeOr(attributes, "r:id", "");

        if (info.name.empty() || info.sheet_id.empty()) {
            READER_WARN("Sheet element missing attributes: name='{}', sheetId='{}'", info.name, info.sheet_id);
            return;
        }

        auto rel_it = relationships_.find(info.rel_id);
        if (rel_it != relationships_.end()) {
            info.worksheet_path = resolveTarget(rel_it->second);
        } else {
            // 回退到默认路径构造方式
            info.worksheet_path = "xl/worksheets/sheet" + info.sheet_id + ".xml";
            READER_DEBUG("Relationship {} not found, using default path {}", info.rel_id, info.worksheet_path);
        }

        READER_DEBUG("Found sheet: {} (ID: {}) -> {}", info.name, info.sheet_id, info.worksheet_path);
        worksheets_.push_back(std::move(info));
    }
}

void WorkbookParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "sheets") {
        in_sheets_section_ = false;
    }
}

std::string WorkbookParser::resolveTarget(const std::string& target) {
    if (!target.empty() && target.front() == '/') {
        return target.substr(1);
    }
    return "xl/" + target;
}

}} // namespace gridbind::reader
