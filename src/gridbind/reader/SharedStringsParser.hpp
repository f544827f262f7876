#pragma once

#include "BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace gridbind {
namespace reader {

/**
 * @brief 共享字符串表解析器（xl/sharedStrings.xml）
 *
 * 每个 <si> 生成一项：纯文本 <t> 或富文本 <r><t> 拼接而成，
 * 注音 <rPh> 中的文本不计入。
 */
class SharedStringsParser : public BaseSAXParser {
public:
    SharedStringsParser() = default;
    ~SharedStringsParser() override = default;

    bool parse(const std::string& xml_content) {
        clear();
        return parseXML(xml_content);
    }

    /**
     * @brief 根据索引获取字符串
     * @return 索引无效时返回 nullptr
     */
    const std::string* getString(size_t index) const {
        return index < strings_.size() ? &strings_[index] : nullptr;
    }

    size_t getStringCount() const { return strings_.size(); }
    const std::vector<std::string>& getStrings() const { return strings_; }

    void clear();

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    std::vector<std::string> strings_;

    bool in_si_ = false;
    bool in_phonetic_ = false;   // <rPh> 注音
    std::string current_string_;
};

}} // namespace gridbind::reader
