#pragma once

#include "BaseSAXParser.hpp"
#include "gridbind/core/NumberFormatTypes.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gridbind {
namespace reader {

/**
 * @brief 样式表解析器（xl/styles.xml）
 *
 * 只读取解码需要的部分：
 * - <numFmts> 自定义数字格式（numFmtId -> formatCode）
 * - <cellXfs> 单元格格式记录的 numFmtId（单元格的 s 属性即为其索引）
 * 字体、填充、边框等外观信息不解析。
 */
class StylesParser : public BaseSAXParser {
public:
    StylesParser() = default;
    ~StylesParser() override = default;

    bool parse(const std::string& xml_content) {
        clear();
        return parseXML(xml_content);
    }

    /**
     * @brief 样式索引对应的数字格式代码
     * @return 未知索引返回 "General"
     */
    std::string getFormatCode(size_t style_index) const;

    /**
     * @brief 样式索引对应的格式类别，General 或未知索引返回空
     */
    std::optional<core::NumberFormatKind> getFormatKind(size_t style_index) const;

    /**
     * @brief Excel内置数字格式（numFmtId 0-49），未知 id 返回 "General"
     */
    static std::string getBuiltinNumberFormat(int format_id);

    size_t getCellXfCount() const { return cell_xf_num_fmts_.size(); }
    const std::unordered_map<int, std::string>& getCustomFormats() const { return custom_formats_; }

    void clear() {
        custom_formats_.clear();
        cell_xf_num_fmts_.clear();
        in_num_fmts_ = false;
        in_cell_xfs_ = false;
    }

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    std::unordered_map<int, std::string> custom_formats_;
    std::vector<int> cell_xf_num_fmts_;

    bool in_num_fmts_ = false;
    bool in_cell_xfs_ = false;
};

}} // namespace gridbind::reader
