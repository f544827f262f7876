#include "gridbind/reader/SharedStringsParser.hpp"

namespace gridbind {
namespace reader {

void SharedStringsParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& /*attributes*/, int /*depth*/) {
    if (name == "si") {
        in_si_ = true;
        current_string_.clear();
    } else if (name == "rPh") {
        in_phonetic_ = true;
    } else if (name == "t" && in_si_ && !in_phonetic_) {
        startCollectingText();
    }
}

void SharedStringsParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "t") {
        if (state_.collecting_text) {
            current_string_ += getCurrentText();
            stopCollectingText();
        }
    } else if (name == "rPh") {
        in_phonetic_ = false;
    } else if (name == "si") {
        strings_.push_back(std::move(current_string_));
        current_string_.clear();
        in_si_ = false;
    }
}

void SharedStringsParser::clear() {
    strings_.clear();
    current_string_.clear();
    in_si_ = false;
    in_phonetic_ = false;
}

}} // namespace gridbind::reader
