#include "gridbind/core/NumberFormatTypes.hpp"
#include <cctype>

namespace gridbind {
namespace core {

const char* toString(NumberFormatKind kind) {
    switch (kind) {
        case NumberFormatKind::Text:       return "TEXT";
        case NumberFormatKind::Number:     return "NUMBER";
        case NumberFormatKind::Percent:    return "PERCENT";
        case NumberFormatKind::Currency:   return "CURRENCY";
        case NumberFormatKind::Date:       return "DATE";
        case NumberFormatKind::Time:       return "TIME";
        case NumberFormatKind::DateTime:   return "DATE_TIME";
        case NumberFormatKind::Scientific: return "SCIENTIFIC";
        default:                           return "NUMBER_FORMAT_TYPE_UNSPECIFIED";
    }
}

NumberFormatKind parseNumberFormatKind(std::string_view tag) {
    if (tag == "TEXT") return NumberFormatKind::Text;
    if (tag == "NUMBER") return NumberFormatKind::Number;
    if (tag == "PERCENT") return NumberFormatKind::Percent;
    if (tag == "CURRENCY") return NumberFormatKind::Currency;
    if (tag == "DATE") return NumberFormatKind::Date;
    if (tag == "TIME") return NumberFormatKind::Time;
    if (tag == "DATE_TIME") return NumberFormatKind::DateTime;
    if (tag == "SCIENTIFIC") return NumberFormatKind::Scientific;
    return NumberFormatKind::Unspecified;
}

bool isTemporal(NumberFormatKind kind) {
    return kind == NumberFormatKind::Date ||
           kind == NumberFormatKind::Time ||
           kind == NumberFormatKind::DateTime;
}

std::optional<NumberFormatKind> classifyFormatCode(std::string_view format_code) {
    if (format_code.empty()) {
        return std::nullopt;
    }

    // 只看第一段（正数段）
    bool has_date = false;
    bool has_time = false;
    bool has_percent = false;
    bool has_exponent = false;
    bool has_text = false;
    bool has_currency = false;
    bool has_general = false;
    bool in_quotes = false;
    bool last_was_hour = false;

    for (size_t i = 0; i < format_code.size(); ++i) {
        const char raw = format_code[i];
        if (in_quotes) {
            if (raw == '"') {
                in_quotes = false;
            } else if (raw == '$') {
                has_currency = true;
            }
            continue;
        }

        if (raw == '[') {
            const size_t close = format_code.find(']', i);
            if (close == std::string_view::npos) {
                break;
            }
            const std::string_view content = format_code.substr(i + 1, close - i - 1);
            if (!content.empty() && content.find_first_not_of("hHmMsS") == std::string_view::npos) {
                // [h]、[mm]、[ss] 经过时间
                has_time = true;
                last_was_hour = (content[0] == 'h' || content[0] == 'H');
            } else if (content.size() >= 2 && content[0] == '$' && content[1] != '-') {
                // [$€-407] 货币符号；[$-409] 仅为区域设置
                has_currency = true;
            }
            i = close;
            continue;
        }

        switch (raw) {
            case '"':
                in_quotes = true;
                continue;
            case '\\':
            case '_':
            case '*':
                ++i;  // 跳过下一个字符
                continue;
            case ';':
                i = format_code.size();
                continue;
            case '%':
                has_percent = true;
                continue;
            case '@':
                has_text = true;
                continue;
            case '$':
                has_currency = true;
                continue;
            default:
                break;
        }

        const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
        if ((c == 'e') && i + 1 < format_code.size() &&
            (format_code[i + 1] == '+' || format_code[i + 1] == '-')) {
            has_exponent = true;
            continue;
        }
        if (c == 'g' && format_code.substr(i).size() >= 7) {
            std::string_view word = format_code.substr(i, 7);
            if (word == "General" || word == "general" || word == "GENERAL") {
                has_general = true;
                i += 6;
                continue;
            }
        }
        if (c == 'y' || c == 'd') {
            has_date = true;
            last_was_hour = false;
        } else if (c == 'h' || c == 's') {
            has_time = true;
            last_was_hour = (c == 'h');
        } else if (c == 'm') {
            // m 紧跟在 h 之后或位于 s 之前表示分钟，否则是月份
            size_t next = format_code.find_first_not_of("mM", i);
            bool before_seconds = next != std::string_view::npos &&
                                  format_code.substr(next).find_first_of("sS") != std::string_view::npos &&
                                  format_code.substr(next).find_first_of("yYdD") == std::string_view::npos;
            if (last_was_hour || before_seconds) {
                has_time = true;
            } else {
                has_date = true;
            }
            if (next != std::string_view::npos) {
                i = next - 1;
            } else {
                i = format_code.size();
            }
        } else if (c == 'a' && format_code.substr(i, 5) == "AM/PM") {
            has_time = true;
            i += 4;
        }
    }

    if (has_date && has_time) return NumberFormatKind::DateTime;
    if (has_date) return NumberFormatKind::Date;
    if (has_time) return NumberFormatKind::Time;
    if (has_text) return NumberFormatKind::Text;
    if (has_percent) return NumberFormatKind::Percent;
    if (has_exponent) return NumberFormatKind::Scientific;
    if (has_currency) return NumberFormatKind::Currency;
    if (has_general) return std::nullopt;
    return NumberFormatKind::Number;
}

}} // namespace gridbind::core
