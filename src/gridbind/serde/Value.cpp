#include "gridbind/serde/Value.hpp"
#include "gridbind/core/Cell.hpp"
#include <fmt/format.h>

namespace gridbind {
namespace serde {

namespace {

void appendQuoted(std::string& out, const std::string& text) {
    out.push_back('"');
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out.push_back(c); break;
        }
    }
    out.push_back('"');
}

void appendValue(std::string& out, const Value& value) {
    switch (value.type()) {
        case Value::Type::Null:
            out += "null";
            break;
        case Value::Type::Bool:
            out += value.asBool() ? "true" : "false";
            break;
        case Value::Type::Number:
            out += core::formatNumber(value.asNumber());
            break;
        case Value::Type::String:
            appendQuoted(out, value.asString());
            break;
        case Value::Type::Array: {
            out.push_back('[');
            bool first = true;
            for (const auto& item : value.asArray()) {
                if (!first) out.push_back(',');
                first = false;
                appendValue(out, item);
            }
            out.push_back(']');
            break;
        }
        case Value::Type::Object: {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, item] : value.asObject()) {
                if (!first) out.push_back(',');
                first = false;
                appendQuoted(out, key);
                out.push_back(':');
                appendValue(out, item);
            }
            out.push_back('}');
            break;
        }
    }
}

} // namespace

const Value* Value::find(std::string_view key) const {
    if (!isObject()) {
        return nullptr;
    }
    for (const auto& entry : asObject()) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

size_t Value::size() const {
    if (isArray()) return asArray().size();
    if (isObject()) return asObject().size();
    return 0;
}

std::string Value::toString() const {
    std::string out;
    appendValue(out, *this);
    return out;
}

}} // namespace gridbind::serde
