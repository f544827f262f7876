#include "gridbind/xml/XMLStreamReader.hpp"
#include "gridbind/utils/ModuleLoggers.hpp"
#include <cstring>
#include <fmt/format.h>

namespace gridbind {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attribute_pool_.reserve(16);
    resetState();
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    is_parsing_ = false;
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attribute_pool_.clear();
    current_text_.clear();
    bytes_parsed_ = 0;
    elements_parsed_ = 0;
}

// 回调函数设置
void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

void XMLStreamReader::setErrorCallback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

void XMLStreamReader::setTrimWhitespace(bool trim) {
    trim_whitespace_ = trim;
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Invalid buffer or size");
        return XMLParseError::InvalidInput;
    }

    XMLParseError status = beginParsing();
    if (isError(status)) {
        return status;
    }
    return parseChunk(buffer, size, true);
}

XMLParseError XMLStreamReader::beginParsing() {
    resetState();
    if (!initializeParser()) {
        return last_error_;
    }
    is_parsing_ = true;
    return XMLParseError::Ok;
}

XMLParseError XMLStreamReader::feedData(const char* data, size_t size) {
    return parseChunk(data, size, false);
}

XMLParseError XMLStreamReader::endParsing() {
    return parseChunk(nullptr, 0, true);
}

XMLParseError XMLStreamReader::parseChunk(const char* chunk, size_t size, bool is_final) {
    if (!parser_ || !is_parsing_) {
        handleError(XMLParseError::ParserCreateFailed, "Parser not initialized");
        return XMLParseError::ParserCreateFailed;
    }
    // 回调失败后不再继续喂入数据
    if (isError(last_error_)) {
        return last_error_;
    }

    int length = 0;
    if (chunk && size > 0) {
        // 使用ParseBuffer API，减少一次内存拷贝
        void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
        if (!expat_buffer) {
            handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
            is_parsing_ = false;
            return XMLParseError::MemoryError;
        }
        std::memcpy(expat_buffer, chunk, size);
        length = static_cast<int>(size);
        bytes_parsed_ += size;
    }

    if (XML_ParseBuffer(parser_, length, is_final ? 1 : 0) == XML_STATUS_ERROR) {
        is_parsing_ = false;
        return reportExpatError();
    }

    if (is_final) {
        is_parsing_ = false;
        XML_DEBUG("Successfully parsed {} bytes, {} elements", bytes_parsed_, elements_parsed_);
    }
    return XMLParseError::Ok;
}

XMLParseError XMLStreamReader::reportExpatError() {
    // 回调中止的解析已经记录过错误
    if (isError(last_error_)) {
        return last_error_;
    }
    std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
        XML_GetCurrentLineNumber(parser_),
        XML_GetCurrentColumnNumber(parser_),
        XML_ErrorString(XML_GetErrorCode(parser_)));
    handleError(XMLParseError::ParseFailed, error_msg);
    return XMLParseError::ParseFailed;
}

// libexpat回调函数实现
void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    std::string_view element_name{name, std::strlen(name)};

    reader->elements_parsed_++;

    reader->attribute_pool_.clear();
    for (int i = 0; attrs[i]; i += 2) {
        reader->attribute_pool_.emplace_back(std::string_view{attrs[i]}, std::string_view{attrs[i + 1]});
    }

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, reader->attribute_pool_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortFromCallback("Start element", e);
            return;
        }
    }

    reader->current_depth_++;
    reader->current_text_.clear();
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->current_depth_--;

    std::string_view element_name{name, std::strlen(name)};

    // 先回调累积的文本，再回调结束标签
    if (!reader->current_text_.empty() && reader->text_callback_) {
        std::string_view text_content = reader->trim_whitespace_ ?
            trimStringView(reader->current_text_) : std::string_view{reader->current_text_};
        if (!text_content.empty()) {
            try {
                reader->text_callback_(text_content, reader->current_depth_);
            } catch (const std::exception& e) {
                reader->abortFromCallback("Text", e);
                return;
            }
        }
    }

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortFromCallback("End element", e);
            return;
        }
    }

    reader->current_text_.clear();
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

// 内部辅助方法

void XMLStreamReader::abortFromCallback(const char* stage, const std::exception& e) {
    handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", stage, e.what()));
    XML_StopParser(parser_, XML_FALSE);
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) {
    const char* whitespace = " \t\n\r";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;

    XML_WARN("XML parse error: {}", message);

    if (error_callback_) {
        int line = parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : -1;
        int column = parser_ ? static_cast<int>(XML_GetCurrentColumnNumber(parser_)) : -1;
        error_callback_(error, message, line, column);
    }
}

}} // namespace gridbind::xml
