#pragma once

#include "BaseSAXParser.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace gridbind {
namespace reader {

/**
 * @brief 关系文件解析器（*.rels）
 */
class RelationshipsParser : public BaseSAXParser {
public:
    struct Relationship {
        std::string id;          // 如 "rId1"
        std::string type;        // 如 ".../relationships/worksheet"
        std::string target;      // 如 "worksheets/sheet1.xml"
        std::string target_mode = "Internal";
    };

    RelationshipsParser() = default;
    ~RelationshipsParser() override = default;

    bool parse(const std::string& xml_content) {
        clear();
        return parseXML(xml_content);
    }

    const std::vector<Relationship>& getRelationships() const { return relationships_; }

    /**
     * @return 未找到返回nullptr
     */
    const Relationship* findById(const std::string& id) const;

    /**
     * @brief 按类型后缀查找（如 "worksheet" 匹配完整的关系类型 URI）
     */
    std::vector<const Relationship*> findByType(std::string_view type_suffix) const;

    /**
     * @brief 关系 Id -> Target 映射，供 WorkbookParser 使用
     */
    std::unordered_map<std::string, std::string> targetMap() const;

    size_t getRelationshipCount() const { return relationships_.size(); }

    void clear() {
        relationships_.clear();
        id_index_.clear();
    }

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view /*name*/, int /*depth*/) override {}

private:
    std::vector<Relationship> relationships_;
    std::unordered_map<std::string, size_t> id_index_;
};

}} // namespace gridbind::reader
