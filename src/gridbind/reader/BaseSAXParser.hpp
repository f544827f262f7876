#pragma once

#include "gridbind/xml/XMLStreamReader.hpp"
#include "gridbind/utils/ModuleLoggers.hpp"
#include <fast_float/fast_float.h>
#include <fmt/format.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gridbind {
namespace reader {

/**
 * @brief 通用SAX解析器基类
 *
 * 基于 XMLStreamReader 的事件回调，子类只需实现 onStartElement /
 * onEndElement（以及可选的 onText）。支持一次性解析整段 XML，
 * 也支持分块喂入（beginParsing / feedData / endParsing）。
 *
 * 文本只在 startCollectingText() 之后累积，实体已由 expat 解码，
 * 空白原样保留。
 */
class BaseSAXParser {
protected:
    // 通用解析状态
    struct ParseState {
        // 元素栈用于跟踪嵌套结构
        std::vector<std::string> element_stack;
        int current_depth = 0;
        std::string current_text;
        bool collecting_text = false;
        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            current_depth = 0;
            current_text.clear();
            collecting_text = false;
            has_error = false;
            error_message.clear();
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @return 是否解析成功，失败原因见 getErrorMessage()
     */
    bool parseXML(const std::string& xml_content) {
        if (xml_content.empty()) {
            state_.has_error = true;
            state_.error_message = "Empty XML content";
            return false;
        }
        if (!beginParsing()) {
            return false;
        }
        if (!feedData(xml_content.data(), xml_content.size())) {
            return false;
        }
        return endParsing();
    }

    // ========== 分块解析 ==========

    bool beginParsing() {
        state_.reset();
        reader_ = std::make_unique<xml::XMLStreamReader>();
        reader_->setTrimWhitespace(false);

        reader_->setStartElementCallback([this](std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) {
            handleStartElement(name, attributes, depth);
        });
        reader_->setEndElementCallback([this](std::string_view name, int depth) {
            handleEndElement(name, depth);
        });
        reader_->setTextCallback([this](std::string_view text, int depth) {
            handleText(text, depth);
        });
        reader_->setErrorCallback([this](xml::XMLParseError, const std::string& message, int line, int column) {
            state_.has_error = true;
            state_.error_message = fmt::format("XML Parse Error at line {}, column {}: {}", line, column, message);
        });

        return checkStatus(reader_->beginParsing());
    }

    bool feedData(const char* data, size_t size) {
        if (!reader_) {
            setError("Parser not started");
            return false;
        }
        if (size == 0) {
            return !state_.has_error;
        }
        return checkStatus(reader_->feedData(data, size));
    }

    bool endParsing() {
        if (!reader_) {
            setError("Parser not started");
            return false;
        }
        bool ok = checkStatus(reader_->endParsing());
        reader_.reset();
        return ok;
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

protected:
    virtual void handleStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) {
        state_.element_stack.emplace_back(name);
        state_.current_depth = depth;
        onStartElement(name, attributes, depth);
    }

    virtual void handleEndElement(std::string_view name, int depth) {
        if (!state_.element_stack.empty()) {
            state_.element_stack.pop_back();
        }
        state_.current_depth = depth;
        onEndElement(name, depth);
    }

    virtual void handleText(std::string_view text, int depth) {
        if (state_.collecting_text) {
            state_.current_text.append(text.data(), text.size());
        }
        onText(text, depth);
    }

    // 子类重写的虚函数
    virtual void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    // ==================== 通用工具方法 ====================

    static std::optional<std::string_view> findAttribute(const std::vector<xml::XMLAttribute>& attributes, std::string_view name) {
        for (const auto& attr : attributes) {
            if (attr.name == name) {
                return attr.value;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief 整数属性提取（fast_float），整段都必须是数字
     */
    static std::optional<int> findIntAttribute(const std::vector<xml::XMLAttribute>& attributes, std::string_view name) {
        auto val = findAttribute(attributes, name);
        if (!val) {
            return std::nullopt;
        }
        return parseInt(*val);
    }

    static std::optional<int> parseInt(std::string_view text) {
        int value = 0;
        auto result = fast_float::from_chars(text.data(), text.data() + text.size(), value);
        if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    static std::optional<double> parseDouble(std::string_view text) {
        double value = 0.0;
        auto result = fast_float::from_chars(text.data(), text.data() + text.size(), value);
        if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    /**
     * @brief 布尔属性："1" / "true" 为真
     */
    static bool getBoolAttributeOr(const std::vector<xml::XMLAttribute>& attributes, std::string_view name, bool default_value) {
        auto val = findAttribute(attributes, name);
        if (!val) {
            return default_value;
        }
        return *val == "1" || *val == "true" || *val == "True" || *val == "TRUE";
    }

    static std::string getAttributeOr(const std::vector<xml::XMLAttribute>& attributes, std::string_view name, std::string_view default_value) {
        auto val = findAttribute(attributes, name);
        return std::string(val ? *val : default_value);
    }

    void startCollectingText() {
        state_.collecting_text = true;
        state_.current_text.clear();
    }

    void stopCollectingText() {
        state_.collecting_text = false;
    }

    void setError(const std::string& message) {
        if (!state_.has_error) {
            state_.has_error = true;
            state_.error_message = message;
        }
        READER_WARN("Parser Error: {}", message);
    }

    const std::string& getCurrentText() const {
        return state_.current_text;
    }

private:
    std::unique_ptr<xml::XMLStreamReader> reader_;

    bool checkStatus(xml::XMLParseError status) {
        if (xml::isError(status)) {
            if (!state_.has_error) {
                state_.has_error = true;
                state_.error_message = reader_ ? reader_->getLastErrorMessage() : "XML parsing failed";
            }
            reader_.reset();
            return false;
        }
        return !state_.has_error;
    }
};

}} // namespace gridbind::reader
