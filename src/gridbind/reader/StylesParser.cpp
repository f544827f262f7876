#include "gridbind/reader/StylesParser.hpp"

namespace gridbind {
namespace reader {

void StylesParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name == "numFmts") {
        in_num_fmts_ = true;
    } else if (name == "cellXfs") {
        in_cell_xfs_ = true;
    } else if (name == "numFmt" && in_num_fmts_) {
        auto id = findIntAttribute(attributes, "numFmtId");
        auto code = findAttribute(attributes, "formatCode");
        if (id && code) {
            custom_formats_[*id] = std::string(*code);
        } else {
            READER_WARN("numFmt without numFmtId or formatCode skipped");
        }
    } else if (name == "xf" && in_cell_xfs_) {
        // 没有 numFmtId 的记录使用 General
        cell_xf_num_fmts_.push_back(findIntAttribute(attributes, "numFmtId").value_or(0));
    }
}

void StylesParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "numFmts") {
        in_num_fmts_ = false;
    } else if (name == "cellXfs") {
        in_cell_xfs_ = false;
        READER_DEBUG("Parsed {} cell formats, {} custom number formats",
                     cell_xf_num_fmts_.size(), custom_formats_.size());
    }
}

std::string StylesParser::getFormatCode(size_t style_index) const {
    if (style_index >= cell_xf_num_fmts_.size()) {
        return "General";
    }
    const int format_id = cell_xf_num_fmts_[style_index];
    auto it = custom_formats_.find(format_id);
    if (it != custom_formats_.end()) {
        return it->second;
    }
    return getBuiltinNumberFormat(format_id);
}

std::optional<core::NumberFormatKind> StylesParser::getFormatKind(size_t style_index) const {
    return core::classifyFormatCode(getFormatCode(style_index));
}

std::string StylesParser::getBuiltinNumberFormat(int format_id) {
    // Excel内置数字格式
    static const std::unordered_map<int, std::string> builtin_formats = {
        {0, "General"},
        {1, "0"},
        {2, "0.00"},
        {3, "#,##0"},
        {4, "#,##0.00"},
        {9, "0%"},
        {10, "0.00%"},
        {11, "0.00E+00"},
        {12, "# ?/?"},
        {13, "# ??/??"},
        {14, "mm-dd-yy"},
        {15, "d-mmm-yy"},
        {16, "d-mmm"},
        {17, "mmm-yy"},
        {18, "h:mm AM/PM"},
        {19, "h:mm:ss AM/PM"},
        {20, "h:mm"},
        {21, "h:mm:ss"},
        {22, "m/d/yy h:mm"},
        {37, "#,##0 ;(#,##0)"},
        {38, "#,##0 ;[Red](#,##0)"},
        {39, "#,##0.00;(#,##0.00)"},
        {40, "#,##0.00;[Red](#,##0.00)"},
        {45, "mm:ss"},
        {46, "[h]:mm:ss"},
        {47, "mmss.0"},
        {48, "##0.0E+0"},
        {49, "@"}
    };

    auto it = builtin_formats.find(format_id);
    return (it != builtin_formats.end()) ? it->second : "General";
}

}} // namespace gridbind::reader
