#include "gridbind/reader/RelationshipsParser.hpp"

namespace gridbind {
namespace reader {

void RelationshipsParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name != "Relationship") {
        return;
    }

    Relationship rel;
    rel.id = getAttributeOr(attributes, "Id", "");
    rel.type = getAttributeOr(attributes, "Type", "");
    rel.target = getAttributeOr(attributes, "Target", "");
    rel.target_mode = getAttributeOr(attributes, "TargetMode", "Internal");

    if (rel.id.empty() || rel.target.empty()) {
        READER_WARN("Relationship without Id or Target skipped");
        return;
    }

    id_index_[rel.id] = relationships_.size();
    relationships_.push_back(std::move(rel));
}

const RelationshipsParser::Relationship* RelationshipsParser::findById(const std::string& id) const {
    auto it = id_index_.find(id);
    return it != id_index_.end() ? &relationships_[it->second] : nullptr;
}

std::vector<const RelationshipsParser::Relationship*> RelationshipsParser::findByType(std::string_view type_suffix) const {
    std::vector<const Relationship*> result;
    for (const auto& rel : relationships_) {
        std::string_view type(rel.type);
        if (type.size() >= type_suffix.size() &&
            type.compare(type.size() - type_suffix.size(), type_suffix.size(), type_suffix) == 0) {
            result.push_back(&rel);
        }
    }
    return result;
}

std::unordered_map<std::string, std::string> RelationshipsParser::targetMap() const {
    std::unordered_map<std::string, std::string> map;
    for (const auto& rel : relationships_) {
        map.emplace(rel.id, rel.target);
    }
    return map;
}

}} // namespace gridbind::reader
